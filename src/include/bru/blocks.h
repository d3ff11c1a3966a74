#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace bru {

enum class BlockKind { Dictionary, Text, Array };

struct DictionaryEntry {
    std::string key;
    std::string value;

    bool disabled() const { return !key.empty() && key.front() == '~'; }

    bool operator==(const DictionaryEntry& o) const { return key == o.key && value == o.value; }
    bool operator!=(const DictionaryEntry& o) const { return !(*this == o); }
};

// `type` holds the tag suffix after the first ':' ("secret" for
// "vars:secret"); an empty string means the tag had none.
struct DictionaryBlock {
    std::string name;
    std::string type;
    std::vector<DictionaryEntry> content;

    DictionaryBlock() = default;
    DictionaryBlock(std::string n, std::string t = "", std::vector<DictionaryEntry> c = {})
        : name(std::move(n)), type(std::move(t)), content(std::move(c)) {}

    bool operator==(const DictionaryBlock& o) const {
        return name == o.name && type == o.type && content == o.content;
    }
    bool operator!=(const DictionaryBlock& o) const { return !(*this == o); }
};

struct TextBlock {
    std::string name;
    std::string type;
    std::string content;

    TextBlock() = default;
    TextBlock(std::string n, std::string t = "", std::string c = "")
        : name(std::move(n)), type(std::move(t)), content(std::move(c)) {}

    bool operator==(const TextBlock& o) const {
        return name == o.name && type == o.type && content == o.content;
    }
    bool operator!=(const TextBlock& o) const { return !(*this == o); }
};

struct ArrayBlock {
    std::string name;
    std::string type;
    std::vector<std::string> content;

    ArrayBlock() = default;
    ArrayBlock(std::string n, std::string t = "", std::vector<std::string> c = {})
        : name(std::move(n)), type(std::move(t)), content(std::move(c)) {}

    bool operator==(const ArrayBlock& o) const {
        return name == o.name && type == o.type && content == o.content;
    }
    bool operator!=(const ArrayBlock& o) const { return !(*this == o); }
};

using Block = std::variant<DictionaryBlock, TextBlock, ArrayBlock>;

// Common accessors over the three block variants.
const std::string& block_name(const Block& b);
const std::string& block_type(const Block& b);
BlockKind block_kind(const Block& b);

// Full source tag, e.g. "vars:secret".
std::string block_tag(const Block& b);

const char* kind_name(BlockKind kind);

struct TagEntry {
    const char* tag;
    BlockKind kind;
};

// The closed table of legal tags. A tag is legal only if it appears here
// verbatim, suffix included.
const std::vector<TagEntry>& tag_table();

std::optional<BlockKind> find_tag(const std::string& tag);

// Split a tag on its first ':' into (name, type).
std::pair<std::string, std::string> split_tag(const std::string& tag);

// Build an empty block of the given kind for `tag`.
Block make_block(BlockKind kind, const std::string& tag);

}  // namespace bru
