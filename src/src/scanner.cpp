#include <bru/scanner.h>
#include <bru/blocks.h>
#include <cstdio>

namespace bru {

namespace {
    bool is_space(char c) { return c == ' ' or c == '\t' or c == '\r' or c == '\n'; }

    bool is_control(char c) { return static_cast<unsigned char>(c) < 0x20; }

    bool is_hex(char c) {
        return ('0' <= c and c <= '9') or ('a' <= c and c <= 'f') or ('A' <= c and c <= 'F');
    }
}

std::string quote_char(char c) {
    switch (c) {
        case '\'':
            return "'\\''";
        case '\n':
            return "'\\n'";
        case '\r':
            return "'\\r'";
        case '\t':
            return "'\\t'";
        default:
            break;
    }
    unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x20 or u >= 0x7f) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "'\\x%02x'", static_cast<unsigned>(u));
        return buf;
    }
    return std::string("'") + c + "'";
}

Scanner::Scanner() { parse_state_.reserve(max_nesting_depth + 1); }

void Scanner::reset() {
    state_ = State::BeginBlockLine;
    escape_return_ = State::InValue;
    parse_state_.clear();
    tag_.clear();
    in_block_ = false;
    bytes_ = 0;
    err_.reset();
}

void Scanner::shrink() {
    if (tag_.capacity() > 1024) std::string().swap(tag_);
}

Opcode Scanner::step(char c) {
    ++bytes_;
    return dispatch(c);
}

Opcode Scanner::eof() {
    if (err_) return Opcode::Error;
    if (not in_block_) return Opcode::End;
    // Flush whatever is in flight; a pending tag is checked by the space.
    dispatch(' ');
    if (err_) return Opcode::Error;
    if (not in_block_) return Opcode::End;
    return fail("unexpected end of Bru input");
}

Opcode Scanner::dispatch(char c) {
    switch (state_) {
        case State::BeginBlockLine:
            return begin_block_line(c);
        case State::ReadingTag:
            return reading_tag(c);
        case State::WaitingForOpenBlock:
            return waiting_for_open_block(c);
        case State::OpenBlock:
            return open_block(c);
        case State::NewDictionaryPair:
            return new_dictionary_pair(c);
        case State::InKey:
            return in_key(c);
        case State::BeginDictionaryValue:
            return begin_dictionary_value(c);
        case State::InValue:
            return in_value(c);
        case State::NewArrayValue:
            return new_array_value(c);
        case State::NewTextLine:
            return new_text_line(c);
        case State::InText:
            return in_text(c);
        case State::StringEsc:
            return string_escape(c);
        case State::StringEscU:
            return string_escape_hex(c, State::StringEscU1);
        case State::StringEscU1:
            return string_escape_hex(c, State::StringEscU12);
        case State::StringEscU12:
            return string_escape_hex(c, State::StringEscU123);
        case State::StringEscU123:
            return string_escape_hex(c, escape_return_);
        case State::Done:
            return Opcode::End;
        case State::Error:
            return Opcode::Error;
    }
    return Opcode::Error;
}

Opcode Scanner::begin_block_line(char c) {
    if (is_space(c)) return Opcode::SkipSpace;
    if ('a' <= c and c <= 'z') {
        tag_.assign(1, c);
        in_block_ = true;
        state_ = State::ReadingTag;
        return Opcode::BeginTag;
    }
    // not a tag: the file ends before this byte
    state_ = State::Done;
    return Opcode::End;
}

Opcode Scanner::reading_tag(char c) {
    if (is_space(c)) return check_tag(c);
    tag_.push_back(c);
    return Opcode::Continue;
}

Opcode Scanner::check_tag(char c) {
    auto kind = find_tag(tag_);
    if (not kind) return fail("invalid tag name: " + tag_);
    tag_.clear();
    state_ = State::WaitingForOpenBlock;
    switch (*kind) {
        case BlockKind::Dictionary:
            return push_parse_state(c, ParseState::DictionaryKey, Opcode::EndTag);
        case BlockKind::Text:
            return push_parse_state(c, ParseState::TextValue, Opcode::EndTag);
        case BlockKind::Array:
            return push_parse_state(c, ParseState::ArrayValue, Opcode::EndTag);
    }
    return error(c, "no state for tag");
}

Opcode Scanner::waiting_for_open_block(char c) {
    if (is_space(c)) return Opcode::SkipSpace;
    switch (current()) {
        case ParseState::DictionaryKey:
            if (c == '{') {
                state_ = State::OpenBlock;
                return Opcode::BeginDictionary;
            }
            break;
        case ParseState::TextValue:
            if (c == '{') {
                state_ = State::OpenBlock;
                return Opcode::BeginText;
            }
            break;
        case ParseState::ArrayValue:
            if (c == '[') {
                state_ = State::OpenBlock;
                return Opcode::BeginArray;
            }
            break;
        case ParseState::DictionaryValue:
            break;
    }
    return error(c, "after block name");
}

Opcode Scanner::open_block(char c) {
    switch (current()) {
        case ParseState::DictionaryKey:
            state_ = State::NewDictionaryPair;
            return new_dictionary_pair(c);
        case ParseState::ArrayValue:
            state_ = State::NewArrayValue;
            return new_array_value(c);
        case ParseState::TextValue:
            // Text starts on the line after the brace.
            if (c == '\n') {
                state_ = State::NewTextLine;
                return Opcode::SkipSpace;
            }
            return error(c, "after text block opening brace");
        case ParseState::DictionaryValue:
            break;
    }
    return error(c, "no state for block");
}

Opcode Scanner::new_dictionary_pair(char c) {
    if (is_space(c)) return Opcode::SkipSpace;
    if (c == '}') {
        pop_parse_state();
        return Opcode::EndBlock;
    }
    if (c == ':') return error(c, "looking for beginning of dictionary key");
    state_ = State::InKey;
    return in_key(c);
}

Opcode Scanner::in_key(char c) {
    if (c == ':') {
        parse_state_.back() = ParseState::DictionaryValue;
        state_ = State::BeginDictionaryValue;
        return Opcode::DictionaryValue;
    }
    if (c == '\n') {
        // A key with no ':' carries an empty value.
        state_ = State::NewDictionaryPair;
        return Opcode::DictionaryKey;
    }
    if (c == '\\') {
        escape_return_ = State::InKey;
        state_ = State::StringEsc;
        return Opcode::Continue;
    }
    if (is_control(c)) return error(c, "in dictionary key");
    return Opcode::Continue;
}

Opcode Scanner::begin_dictionary_value(char c) {
    if (c == '\n') return in_value(c);
    if (is_space(c)) return Opcode::SkipSpace;
    state_ = State::InValue;
    return in_value(c);
}

Opcode Scanner::in_value(char c) {
    if (c == '\\') {
        escape_return_ = State::InValue;
        state_ = State::StringEsc;
        return Opcode::Continue;
    }
    if (c == '\n') {
        if (current() == ParseState::DictionaryValue) {
            parse_state_.back() = ParseState::DictionaryKey;
            state_ = State::NewDictionaryPair;
            return Opcode::DictionaryKey;
        }
        state_ = State::NewArrayValue;
        return Opcode::ArrayValue;
    }
    if (current() == ParseState::ArrayValue) {
        if (c == ',') {
            state_ = State::NewArrayValue;
            return Opcode::ArrayValue;
        }
        if (c == ']') {
            pop_parse_state();
            return Opcode::EndArray;
        }
    }
    if (is_control(c)) return error(c, "in value literal");
    return Opcode::Continue;
}

Opcode Scanner::new_array_value(char c) {
    if (is_space(c)) return Opcode::SkipSpace;
    if (c == ']') {
        pop_parse_state();
        return Opcode::EndArray;
    }
    // Arrays hold raw strings only; a nested composite can never fit.
    if (c == '[' or c == '{') return push_parse_state(c, ParseState::ArrayValue, Opcode::BeginArray);
    if (c == ',') return error(c, "looking for beginning of array value");
    state_ = State::InValue;
    return in_value(c);
}

Opcode Scanner::new_text_line(char c) {
    if (c == '}') {
        pop_parse_state();
        return Opcode::EndBlock;
    }
    // An empty line starts and ends on its newline.
    if (c == '\n') return Opcode::TextLine;
    state_ = State::InText;
    return Opcode::TextLine;
}

Opcode Scanner::in_text(char c) {
    if (c == '\n') {
        state_ = State::NewTextLine;
        return Opcode::SkipSpace;
    }
    return Opcode::Continue;
}

// Escapes are only checked for shape; the value keeps the backslash
// sequence as written.
Opcode Scanner::string_escape(char c) {
    switch (c) {
        case 'b':
        case 'f':
        case 'n':
        case 'r':
        case 't':
        case '\\':
        case '/':
        case '"':
            state_ = escape_return_;
            return Opcode::Continue;
        case 'u':
            state_ = State::StringEscU;
            return Opcode::Continue;
        default:
            break;
    }
    return error(c, "in string escape code");
}

Opcode Scanner::string_escape_hex(char c, State next) {
    if (is_hex(c)) {
        state_ = next;
        return Opcode::Continue;
    }
    return error(c, "in \\u hexadecimal character escape");
}

Opcode Scanner::push_parse_state(char c, ParseState ps, Opcode success) {
    parse_state_.push_back(ps);
    if (parse_state_.size() <= max_nesting_depth) return success;
    return error(c, "exceeded max depth");
}

void Scanner::pop_parse_state() {
    parse_state_.pop_back();
    in_block_ = false;
    state_ = State::BeginBlockLine;
}

Opcode Scanner::error(char c, const std::string& context) {
    return fail("invalid character " + quote_char(c) + " " + context);
}

Opcode Scanner::fail(const std::string& msg) {
    state_ = State::Error;
    err_.emplace(msg, bytes_);
    return Opcode::Error;
}

}  // namespace bru
