#pragma once

#include <cstddef>
#include <string_view>

namespace facetmcp::protocol {

// Deepest array/object nesting accepted anywhere JSON text is parsed.
// Copying and dumping a nlohmann::json value recurse once per level.
constexpr std::size_t kMaxJsonDepth = 128;

// True when `text` opens more than `limit` arrays/objects at once. Brackets
// inside string literals are ignored. The text need not be valid JSON.
bool exceeds_json_depth(std::string_view text, std::size_t limit = kMaxJsonDepth);

}  // namespace facetmcp::protocol
