#include <bru/encode.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace bru {

static void check_separator(const std::string& sep, const char* what) {
    if (sep.empty() or sep == ",") return;
    throw std::invalid_argument(std::string(what) + " must be empty or ',' (got '" + sep + "')");
}

// Every block must be readable again: its name cannot absorb a tag suffix
// and its tag must name the same kind of block in the tag table.
static void check_block(const Block& block, size_t offset) {
    const std::string& name = block_name(block);
    if (name.find(':') != std::string::npos) {
        throw SyntaxError("block name '" + name + "' must not contain ':'", offset);
    }
    std::string tag = block_tag(block);
    auto kind = find_tag(tag);
    if (not kind) throw SyntaxError("could not find block for tag '" + tag + "'", offset);
    if (*kind != block_kind(block)) {
        throw SyntaxError("tag '" + tag + "' expects " + kind_name(*kind) + " content, block holds " +
                              kind_name(block_kind(block)) + " content",
                          offset);
    }
}

static void emit_dictionary(std::ostringstream& out, const DictionaryBlock& block, const std::string& pad,
                            const std::string& sep) {
    out << " {\n";
    for (size_t i = 0; i < block.content.size(); ++i) {
        const auto& e = block.content[i];
        out << pad << e.key << ": " << e.value;
        if (i + 1 < block.content.size()) out << sep;
        out << '\n';
    }
    out << "}\n\n";
}

static void emit_text(std::ostringstream& out, const TextBlock& block) {
    out << " {\n" << block.content << "\n}\n\n";
}

static void emit_array(std::ostringstream& out, const ArrayBlock& block, const std::string& pad,
                       const std::string& sep) {
    out << " [\n";
    for (size_t i = 0; i < block.content.size(); ++i) {
        out << pad << block.content[i];
        if (i + 1 < block.content.size()) out << sep;
        out << '\n';
    }
    out << "]\n\n";
}

Encoder::Encoder(EncodeOptions options) : options_(std::move(options)) {
    if (options_.indent < 0) throw std::invalid_argument("indent must not be negative");
    check_separator(options_.separator, "separator");
    if (options_.array_separator) check_separator(*options_.array_separator, "array separator");
}

std::string Encoder::encode(const std::vector<Block>& blocks) const {
    std::ostringstream out;
    const std::string pad(static_cast<size_t>(options_.indent), ' ');
    const std::string& array_sep = options_.array_separator ? *options_.array_separator : options_.separator;

    for (auto const& block : blocks) {
        check_block(block, static_cast<size_t>(out.tellp()));
        out << block_tag(block);
        switch (block_kind(block)) {
            case BlockKind::Dictionary:
                emit_dictionary(out, std::get<DictionaryBlock>(block), pad, options_.separator);
                break;
            case BlockKind::Text:
                emit_text(out, std::get<TextBlock>(block));
                break;
            case BlockKind::Array:
                emit_array(out, std::get<ArrayBlock>(block), pad, array_sep);
                break;
        }
    }

    // Every block ends with a blank line; the last one does not.
    std::string result = out.str();
    size_t n = result.size();
    if (n >= 2 and result[n - 1] == '\n' and result[n - 2] == '\n') {
        result.resize(n - 2);
        if (options_.trailing_newline) result.push_back('\n');
    }
    return result;
}

std::string dump_bru(const std::vector<Block>& blocks, const EncodeOptions& options) {
    return Encoder(options).encode(blocks);
}

}  // namespace bru
