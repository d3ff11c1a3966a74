#include <bru/decode.h>
#include <bru/scanner.h>
#include <bru/scanner_pool.h>
#include <stdexcept>
#include <utility>

namespace bru {

namespace {
    const char* opcode_name(Opcode op) {
        switch (op) {
            case Opcode::Continue:
                return "continue";
            case Opcode::SkipSpace:
                return "skip-space";
            case Opcode::BeginTag:
                return "begin-tag";
            case Opcode::EndTag:
                return "end-tag";
            case Opcode::BeginArray:
                return "begin-array";
            case Opcode::BeginText:
                return "begin-text";
            case Opcode::BeginDictionary:
                return "begin-dictionary";
            case Opcode::EndBlock:
                return "end-block";
            case Opcode::EndArray:
                return "end-array";
            case Opcode::ArrayValue:
                return "array-value";
            case Opcode::DictionaryKey:
                return "dictionary-key";
            case Opcode::DictionaryValue:
                return "dictionary-value";
            case Opcode::TextLine:
                return "text-line";
            case Opcode::End:
                return "end";
            case Opcode::Error:
                return "error";
        }
        return "unknown";
    }

    // Follows a private scanner over an already validated buffer and cuts
    // keys, values and lines out of it at the opcode boundaries.
    struct Decoder {
        const std::string& s;
        const DecodeOptions& options;
        size_t off = 0;  // next byte to feed
        Opcode opcode = Opcode::Continue;
        Scanner scan;

        Decoder(const std::string& str, const DecodeOptions& opts) : s(str), options(opts) {}

        // Position of the byte that produced `opcode`.
        size_t read_index() const { return off - 1; }

        std::string slice(size_t start) const { return s.substr(start, read_index() - start); }

        void check() {
            if (opcode == Opcode::Error) throw scan.error();
        }

        void scan_next() {
            if (off < s.size()) {
                opcode = scan.step(s[off]);
                ++off;
            } else {
                opcode = scan.eof();
                off = s.size() + 1;
            }
            check();
        }

        // Feed bytes until the scanner reports something other than `op`.
        void scan_while(Opcode op) {
            while (off < s.size()) {
                Opcode next = scan.step(s[off]);
                ++off;
                if (next != op) {
                    opcode = next;
                    check();
                    return;
                }
            }
            off = s.size() + 1;
            opcode = scan.eof();
            check();
        }

        void expect(Opcode op) {
            if (opcode != op) {
                throw SyntaxError(std::string("unexpected ") + opcode_name(opcode) + ", expected " +
                                      opcode_name(op),
                                  scan.bytes());
            }
        }

        std::vector<Block> decode() {
            scan.reset();
            std::vector<Block> blocks;
            while (true) {
                scan_while(Opcode::SkipSpace);
                if (opcode == Opcode::End) break;
                blocks.push_back(read_block());
            }
            return blocks;
        }

        Block read_block() {
            expect(Opcode::BeginTag);
            size_t start = read_index();
            scan_while(Opcode::Continue);
            expect(Opcode::EndTag);
            std::string tag = slice(start);

            auto kind = find_tag(tag);
            if (not kind) throw SyntaxError("could not find block for tag '" + tag + "'", start);
            Block block = make_block(*kind, tag);

            scan_while(Opcode::SkipSpace);
            switch (*kind) {
                case BlockKind::Dictionary:
                    expect(Opcode::BeginDictionary);
                    read_dictionary(std::get<DictionaryBlock>(block).content);
                    break;
                case BlockKind::Array:
                    expect(Opcode::BeginArray);
                    read_array(std::get<ArrayBlock>(block).content);
                    break;
                case BlockKind::Text:
                    expect(Opcode::BeginText);
                    std::get<TextBlock>(block).content = read_text();
                    break;
            }
            return block;
        }

        void read_dictionary(std::vector<DictionaryEntry>& entries) {
            while (true) {
                scan_while(Opcode::SkipSpace);
                if (opcode == Opcode::EndBlock) break;
                expect(Opcode::Continue);

                DictionaryEntry entry;
                size_t start = read_index();
                scan_while(Opcode::Continue);
                entry.key = slice(start);
                if (opcode == Opcode::DictionaryValue) {
                    entry.value = read_dictionary_value();
                } else {
                    // key line without ':'
                    expect(Opcode::DictionaryKey);
                }
                entries.push_back(std::move(entry));
            }
            if (options.separator.empty()) return;
            // the encoder never writes a separator after the last pair
            for (size_t i = 0; i + 1 < entries.size(); ++i) {
                std::string& value = entries[i].value;
                if (not value.empty() and value.back() == ',') value.pop_back();
            }
        }

        std::string read_dictionary_value() {
            scan_while(Opcode::SkipSpace);
            if (opcode == Opcode::DictionaryKey) return std::string();
            expect(Opcode::Continue);

            size_t start = read_index();
            scan_while(Opcode::Continue);
            expect(Opcode::DictionaryKey);
            return slice(start);
        }

        void read_array(std::vector<std::string>& values) {
            while (true) {
                scan_while(Opcode::SkipSpace);
                if (opcode == Opcode::EndArray) return;
                expect(Opcode::Continue);

                size_t start = read_index();
                scan_while(Opcode::Continue);
                if (opcode != Opcode::EndArray) expect(Opcode::ArrayValue);
                values.push_back(slice(start));
                if (opcode == Opcode::EndArray) return;
            }
        }

        std::string read_text() {
            // newline after the opening brace
            scan_next();
            expect(Opcode::SkipSpace);

            std::string content;
            bool first = true;
            while (true) {
                scan_next();
                if (opcode == Opcode::EndBlock) break;
                expect(Opcode::TextLine);

                if (not first) content.push_back('\n');
                first = false;

                size_t start = read_index();
                if (s[start] == '\n') continue;  // empty line
                scan_while(Opcode::Continue);
                expect(Opcode::SkipSpace);
                content += slice(start);
            }
            return content;
        }
    };
}  // anonymous namespace

void validate_bru(const std::string& text) {
    auto scan = ScannerPool::global().acquire();
    for (char c : text) {
        Opcode op = scan->step(c);
        if (op == Opcode::Error) throw scan->error();
        if (op == Opcode::End) return;
    }
    if (scan->eof() == Opcode::Error) throw scan->error();
}

bool is_valid_bru(const std::string& text) {
    try {
        validate_bru(text);
    } catch (const SyntaxError&) {
        return false;
    }
    return true;
}

std::vector<Block> parse_bru(const std::string& text, const DecodeOptions& options) {
    if (not options.separator.empty() and options.separator != ",") {
        throw std::invalid_argument("separator must be empty or ',' (got '" + options.separator + "')");
    }
    validate_bru(text);
    Decoder d(text, options);
    return d.decode();
}

}  // namespace bru
