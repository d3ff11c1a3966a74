#pragma once

#include <bru/error.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bru {

// Lexical event reported for the byte just consumed. Once a scanner has
// returned End or Error it keeps returning it for every further byte.
enum class Opcode {
    Continue,         // uninteresting byte
    SkipSpace,        // whitespace that may be skipped
    BeginTag,         // first byte of a block tag
    EndTag,           // whitespace terminating a recognised tag
    BeginArray,       // '[' opening an array block
    BeginText,        // '{' opening a text block
    BeginDictionary,  // '{' opening a dictionary block
    EndBlock,         // '}' closing a dictionary or text block
    EndArray,         // ']' closing an array block (ends the current value)
    ArrayValue,       // separator ending an array value
    DictionaryKey,    // newline ending a dictionary pair; the next key follows
    DictionaryValue,  // ':' ending a dictionary key
    TextLine,         // first byte of a text line

    End,    // every block closed and no further block starts here
    Error,  // see Scanner::error()
};

// Composite value currently open. The grammar has no nesting, so the stack
// never holds more than one entry.
enum class ParseState { ArrayValue, DictionaryKey, DictionaryValue, TextValue };

constexpr size_t max_nesting_depth = 1;

// Byte-at-a-time Bru state machine. Call reset(), feed every byte to step()
// and finish with eof(). The scanner does not buffer input; callers that
// need the text of a key, value or line slice it from their own buffer using
// the reported opcodes.
class Scanner {
public:
    Scanner();

    // Prepare for a new input. Also clears the byte counter.
    void reset();

    Opcode step(char c);

    // Signal the end of input: End if every block is closed, Error otherwise.
    Opcode eof();

    // Bytes consumed since reset(), the synthetic eof byte excluded.
    size_t bytes() const { return bytes_; }
    size_t depth() const { return parse_state_.size(); }
    bool failed() const { return err_.has_value(); }

    // Only valid when failed() is true.
    const SyntaxError& error() const { return *err_; }

    // Release buffers that grew unusually large (used before pooling).
    void shrink();

private:
    enum class State {
        BeginBlockLine,
        ReadingTag,
        WaitingForOpenBlock,
        OpenBlock,
        NewDictionaryPair,
        InKey,
        BeginDictionaryValue,
        InValue,
        NewArrayValue,
        NewTextLine,
        InText,
        StringEsc,
        StringEscU,
        StringEscU1,
        StringEscU12,
        StringEscU123,
        Done,
        Error,
    };

    Opcode dispatch(char c);

    Opcode begin_block_line(char c);
    Opcode reading_tag(char c);
    Opcode waiting_for_open_block(char c);
    Opcode open_block(char c);
    Opcode new_dictionary_pair(char c);
    Opcode in_key(char c);
    Opcode begin_dictionary_value(char c);
    Opcode in_value(char c);
    Opcode new_array_value(char c);
    Opcode new_text_line(char c);
    Opcode in_text(char c);
    Opcode string_escape(char c);
    Opcode string_escape_hex(char c, State next);

    Opcode check_tag(char c);
    Opcode push_parse_state(char c, ParseState ps, Opcode success);
    void pop_parse_state();
    ParseState current() const { return parse_state_.back(); }

    Opcode error(char c, const std::string& context);
    Opcode fail(const std::string& msg);

    State state_ = State::BeginBlockLine;
    State escape_return_ = State::InValue;
    std::vector<ParseState> parse_state_;
    std::string tag_;
    bool in_block_ = false;
    size_t bytes_ = 0;
    std::optional<SyntaxError> err_;
};

// Render a byte as a quoted character literal for error messages: 'a', '\n',
// '\x01'.
std::string quote_char(char c);

}  // namespace bru
