#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace facetmcp::tools {

// Text form of a variable: strings verbatim, scalars as their JSON literal,
// objects and arrays as compact JSON.
std::string render_variable(const nlohmann::json& value);

// Replaces every "{{key}}" in `source` for each key of `variables` (an
// object), in the object's key order. Text inserted for one key is not
// rescanned for that key, but later keys do see it. Placeholders without a
// matching key are left as they are.
std::string substitute(const std::string& source, const nlohmann::json& variables);

}  // namespace facetmcp::tools
