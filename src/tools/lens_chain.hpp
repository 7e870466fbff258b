#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/service_errors.hpp"

namespace facetmcp::tools {

// One parsed entry of a lens chain: "trim" or "limit(100)". Only a single
// integer argument is supported.
struct LensSpec {
    std::string name;
    std::optional<std::int64_t> argument;
};

core::errors::Result<LensSpec> parse_lens_spec(const std::string& spec);

// Applies one named lens. Unknown names and argument mismatches are
// LensErrors naming the lens.
core::errors::Result<std::string> apply_lens(const std::string& text,
                                             const LensSpec& lens);

// Names of every lens apply_lens understands.
const std::vector<std::string>& builtin_lens_names();

// Parses and applies `specs` left to right. The cancel token is checked
// before each step.
core::errors::Result<std::string> apply_lens_chain(
    const std::string& text, const std::vector<std::string>& specs,
    const std::shared_ptr<std::atomic_bool>& cancel_token = nullptr);

}  // namespace facetmcp::tools
