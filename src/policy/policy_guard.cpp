#include "policy/policy_guard.hpp"

#include <algorithm>
#include <utility>
#include "tools/lens_chain.hpp"

namespace facetmcp::policy {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

PolicyGuard::PolicyGuard(core::config::ToolConfig tool_config)
    : tool_config_(std::move(tool_config)) {}

bool PolicyGuard::is_lens_allowed(const std::string& lens_name) const {
    const auto& allowed = tool_config_.allowed_lenses;
    return std::find(allowed.begin(), allowed.end(), lens_name) != allowed.end();
}

core::errors::Result<std::string> PolicyGuard::validate_facet_source(
    const std::string& facet_source) const {
    const std::size_t limit_bytes =
        static_cast<std::size_t>(tool_config_.max_facet_size_kb) * 1024;
    if (facet_source.size() > limit_bytes) {
        return ServiceError{ErrorCategory::Limit,
                            "facet_source is " + std::to_string(facet_source.size()) +
                                " bytes; the limit is " + std::to_string(limit_bytes),
                            "facet_too_large"};
    }
    return facet_source;
}

core::errors::Result<std::size_t> PolicyGuard::validate_variables(
    const nlohmann::json& variables) const {
    if (variables.is_null()) {
        return std::size_t{0};
    }
    if (!variables.is_object()) {
        return ServiceError{ErrorCategory::Parameter, "variables must be an object",
                            "invalid_variables"};
    }
    if (variables.size() > tool_config_.max_template_variables) {
        return ServiceError{ErrorCategory::Limit,
                            "Too many template variables: " +
                                std::to_string(variables.size()) + " (limit " +
                                std::to_string(tool_config_.max_template_variables) + ")",
                            "too_many_variables"};
    }
    return variables.size();
}

core::errors::Result<std::vector<std::string>> PolicyGuard::validate_lens_chain(
    const std::vector<std::string>& lenses) const {
    if (lenses.size() > tool_config_.max_lens_chain_length) {
        return ServiceError{ErrorCategory::Limit,
                            "Lens chain has " + std::to_string(lenses.size()) +
                                " entries (limit " +
                                std::to_string(tool_config_.max_lens_chain_length) + ")",
                            "lens_chain_too_long"};
    }

    for (const auto& spec : lenses) {
        auto parsed = tools::parse_lens_spec(spec);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        const auto& name = core::errors::get_value(parsed).name;
        const auto& known = tools::builtin_lens_names();
        if (std::find(known.begin(), known.end(), name) == known.end()) {
            return ServiceError{ErrorCategory::Lens, "Unknown lens: " + name, "unknown_lens"};
        }
        if (!is_lens_allowed(name)) {
            return ServiceError{ErrorCategory::Lens,
                                "Lens not allowed: " + name, "lens_not_allowed",
                                "Allowed lenses are configured via FACETMCP_ALLOWED_LENSES."};
        }
    }
    return lenses;
}

}  // namespace facetmcp::policy
