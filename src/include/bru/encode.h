#pragma once

#include <bru/blocks.h>
#include <bru/error.h>
#include <optional>
#include <string>
#include <vector>

namespace bru {

struct EncodeOptions {
    // Spaces before each dictionary pair and array value.
    int indent = 2;
    // Appended to every dictionary pair and array value but the last.
    // Only "" and "," can be read back.
    std::string separator;
    // Overrides `separator` for array blocks when set.
    std::optional<std::string> array_separator;
    // Keep one newline after the final block.
    bool trailing_newline = false;
};

class Encoder {
public:
    Encoder() = default;
    // Throws std::invalid_argument for a negative indent or a separator the
    // decoder would not strip.
    explicit Encoder(EncodeOptions options);

    const EncodeOptions& options() const { return options_; }

    // Throws SyntaxError when a block's tag is unknown or names a different
    // kind of block.
    std::string encode(const std::vector<Block>& blocks) const;

private:
    EncodeOptions options_;
};

// Serialize blocks to Bru text with the given options.
std::string dump_bru(const std::vector<Block>& blocks, const EncodeOptions& options = {});

}  // namespace bru
