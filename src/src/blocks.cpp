#include <bru/blocks.h>

namespace bru {

const std::string& block_name(const Block& b) {
    return std::visit([](const auto& blk) -> const std::string& { return blk.name; }, b);
}

const std::string& block_type(const Block& b) {
    return std::visit([](const auto& blk) -> const std::string& { return blk.type; }, b);
}

BlockKind block_kind(const Block& b) {
    if (std::holds_alternative<DictionaryBlock>(b)) return BlockKind::Dictionary;
    if (std::holds_alternative<TextBlock>(b)) return BlockKind::Text;
    return BlockKind::Array;
}

std::string block_tag(const Block& b) {
    const std::string& type = block_type(b);
    if (type.empty()) return block_name(b);
    return block_name(b) + ":" + type;
}

const char* kind_name(BlockKind kind) {
    switch (kind) {
        case BlockKind::Dictionary:
            return "dictionary";
        case BlockKind::Text:
            return "text";
        case BlockKind::Array:
            return "array";
    }
    return "unknown";
}

const std::vector<TagEntry>& tag_table() {
    static const std::vector<TagEntry> table = {
        {"meta", BlockKind::Dictionary},
        {"vars:secret", BlockKind::Array},
        {"body", BlockKind::Text},
        {"tests", BlockKind::Text},
        {"get", BlockKind::Dictionary},
        {"post", BlockKind::Dictionary},
        {"put", BlockKind::Dictionary},
        {"delete", BlockKind::Dictionary},
        {"options", BlockKind::Dictionary},
        {"trace", BlockKind::Dictionary},
        {"connect", BlockKind::Dictionary},
        {"head", BlockKind::Dictionary},
        {"query", BlockKind::Dictionary},
        {"headers", BlockKind::Dictionary},
        {"body:text", BlockKind::Text},
        {"body:xml", BlockKind::Text},
        {"body:form-urlencoded", BlockKind::Dictionary},
        {"body:multipart-form", BlockKind::Dictionary},
        {"body:graphql", BlockKind::Text},
        {"body:graphql:vars", BlockKind::Text},
        {"script:pre-request", BlockKind::Text},
        {"script:post-response", BlockKind::Text},
        {"body:test", BlockKind::Text},
        {"body:json", BlockKind::Text},
        {"assert", BlockKind::Dictionary},
        {"vars", BlockKind::Dictionary},
    };
    return table;
}

std::optional<BlockKind> find_tag(const std::string& tag) {
    for (auto const& e : tag_table()) {
        if (tag == e.tag) return e.kind;
    }
    return std::nullopt;
}

std::pair<std::string, std::string> split_tag(const std::string& tag) {
    auto colon = tag.find(':');
    if (colon == std::string::npos) return {tag, std::string()};
    return {tag.substr(0, colon), tag.substr(colon + 1)};
}

Block make_block(BlockKind kind, const std::string& tag) {
    auto [name, type] = split_tag(tag);
    switch (kind) {
        case BlockKind::Dictionary:
            return DictionaryBlock(std::move(name), std::move(type));
        case BlockKind::Text:
            return TextBlock(std::move(name), std::move(type));
        case BlockKind::Array:
            break;
    }
    return ArrayBlock(std::move(name), std::move(type));
}

}  // namespace bru
