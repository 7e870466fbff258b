#include "validation/validator_cache.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace facetmcp::validation {

std::string ValidatorCache::canonical_key(const nlohmann::json& schema) {
    // nlohmann::json stores objects in a std::map, so dump() is already
    // key-sorted at every depth.
    return schema.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

core::errors::Result<std::shared_ptr<const SchemaValidator>> ValidatorCache::get_or_compile(
    const nlohmann::json& schema) {
    const std::string key = canonical_key(schema);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = validators_.find(key);
        if (it != validators_.end()) {
            ++hits_;
            return it->second;
        }
    }

    // Compile outside the lock; schemas can be large.
    auto compiled = SchemaValidator::compile(schema);
    if (core::errors::is_error(compiled)) {
        return core::errors::get_error(compiled);
    }
    ++compiles_;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto [it, inserted] = validators_.emplace(key, core::errors::get_value(compiled));
    if (inserted) {
        LOG_DEBUG("ValidatorCache: compiled schema #" + std::to_string(validators_.size()));
    }
    return it->second;
}

std::size_t ValidatorCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validators_.size();
}

}  // namespace facetmcp::validation
