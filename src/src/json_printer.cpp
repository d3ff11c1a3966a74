#include <bru/json.h>
#include <cstdio>
#include <sstream>
#include <string>

namespace bru {

static std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    result.push_back('"');
    return result;
}

namespace {
    struct JsonWriter {
        std::ostringstream out;
        int indent;

        explicit JsonWriter(int ind) : indent(ind) {}

        void newline(int level) {
            if (indent <= 0) return;
            out << '\n';
            for (int k = 0; k < level * indent; ++k) out.put(' ');
        }

        const char* colon() const { return indent > 0 ? ": " : ":"; }

        void field(const char* name, const std::string& value, int level) {
            newline(level);
            out << '"' << name << '"' << colon() << escape_json_string(value) << ',';
        }

        void emit_entries(const std::vector<DictionaryEntry>& entries, int level) {
            if (entries.empty()) {
                out << "[]";
                return;
            }
            out << '[';
            for (size_t i = 0; i < entries.size(); ++i) {
                if (i > 0) out << ',';
                newline(level + 1);
                out << "{\"key\"" << colon() << escape_json_string(entries[i].key) << ','
                    << (indent > 0 ? " " : "") << "\"value\"" << colon()
                    << escape_json_string(entries[i].value) << '}';
            }
            newline(level);
            out << ']';
        }

        void emit_strings(const std::vector<std::string>& values, int level) {
            if (values.empty()) {
                out << "[]";
                return;
            }
            out << '[';
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0) out << ',';
                newline(level + 1);
                out << escape_json_string(values[i]);
            }
            newline(level);
            out << ']';
        }

        void emit_block(const Block& block, int level) {
            out << '{';
            field("tag", block_tag(block), level + 1);
            field("name", block_name(block), level + 1);
            field("type", block_type(block), level + 1);
            field("kind", kind_name(block_kind(block)), level + 1);
            newline(level + 1);
            out << "\"content\"" << colon();
            switch (block_kind(block)) {
                case BlockKind::Dictionary:
                    emit_entries(std::get<DictionaryBlock>(block).content, level + 1);
                    break;
                case BlockKind::Text:
                    out << escape_json_string(std::get<TextBlock>(block).content);
                    break;
                case BlockKind::Array:
                    emit_strings(std::get<ArrayBlock>(block).content, level + 1);
                    break;
            }
            newline(level);
            out << '}';
        }
    };
}

std::string dump_json(const std::vector<Block>& blocks, int indent) {
    if (blocks.empty()) return "[]";
    JsonWriter w(indent);
    w.out << '[';
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) w.out << ',';
        w.newline(1);
        w.emit_block(blocks[i], 1);
    }
    w.newline(0);
    w.out << ']';
    return w.out.str();
}

}  // namespace bru
