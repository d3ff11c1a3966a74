#pragma once

#include <bru/blocks.h>
#include <bru/error.h>
#include <string>
#include <vector>

namespace bru {

// Check that `text` is a well-formed Bru file without building any blocks.
// Throws SyntaxError describing the first defect.
void validate_bru(const std::string& text);

bool is_valid_bru(const std::string& text);

struct DecodeOptions {
    // Entry separator the file was written with, "" or ",". With "," one
    // trailing ',' is removed from every dictionary value except the last
    // of its block. Values are kept as written otherwise.
    std::string separator;
};

// Validate, then decode `text` into blocks in source order. The blocks own
// copies of their strings. Throws SyntaxError, or std::invalid_argument for
// an unsupported separator.
std::vector<Block> parse_bru(const std::string& text, const DecodeOptions& options = {});

}  // namespace bru
