#pragma once

#include <bru/blocks.h>
#include <string>
#include <vector>

namespace bru {

// Render blocks as a JSON array of
//   {"tag": ..., "name": ..., "type": ..., "kind": ..., "content": ...}
// objects. Dictionary content becomes [{"key": ..., "value": ...}, ...],
// array content a list of strings and text content a string.
// indent == 0 keeps everything on one line.
std::string dump_json(const std::vector<Block>& blocks, int indent = 2);

}  // namespace bru
