#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace bru {

// Raised for every malformed Bru input and for blocks the encoder cannot
// express. `offset` is the number of bytes consumed when the error was found
// (for the encoder: the output position of the offending block).
struct SyntaxError : public std::runtime_error {
    size_t offset;
    SyntaxError(const std::string& msg, size_t off) : std::runtime_error(msg), offset(off) {}
};

}  // namespace bru
