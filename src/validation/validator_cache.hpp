#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/service_errors.hpp"
#include "validation/schema_validator.hpp"

namespace facetmcp::validation {

// Process-wide memo of compiled validators keyed by canonical schema text.
// Entries are inserted once and never evicted. Two threads missing on the
// same key may both compile; the first insert wins and both get that entry.
class ValidatorCache {
public:
    core::errors::Result<std::shared_ptr<const SchemaValidator>> get_or_compile(
        const nlohmann::json& schema);

    // Compact dump with object keys in sorted order.
    static std::string canonical_key(const nlohmann::json& schema);

    std::size_t size() const;
    std::size_t hit_count() const { return hits_.load(); }
    std::size_t compile_count() const { return compiles_.load(); }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const SchemaValidator>> validators_;
    std::atomic<std::size_t> hits_{0};
    std::atomic<std::size_t> compiles_{0};
};

}  // namespace facetmcp::validation
