#include "tools/tool_host.hpp"

#include <chrono>
#include <utility>
#include "tools/lens_chain.hpp"
#include "tools/template_substitution.hpp"

namespace facetmcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;

namespace {

constexpr const char* kServerName = "facetmcp";

ServiceError parameter_error(const std::string& message, const std::string& code) {
    return ServiceError{ErrorCategory::Parameter, message, code};
}

bool is_cancelled(const std::shared_ptr<std::atomic_bool>& cancel_token) {
    return cancel_token && cancel_token->load();
}

}  // namespace

core::errors::Result<ExecuteRequest> read_execute_request(const json& parameters) {
    const auto source_it = parameters.find("facet_source");
    if (source_it == parameters.end()) {
        return parameter_error("Missing required parameter: facet_source",
                               "missing_parameter");
    }
    if (!source_it->is_string()) {
        return parameter_error("facet_source must be a string", "invalid_parameter");
    }

    ExecuteRequest request;
    request.facet_source = source_it->get<std::string>();

    const auto vars_it = parameters.find("variables");
    if (vars_it != parameters.end() && !vars_it->is_null()) {
        if (!vars_it->is_object()) {
            return parameter_error("variables must be an object", "invalid_parameter");
        }
        request.variables = *vars_it;
    }
    return request;
}

core::errors::Result<LensRequest> read_lens_request(const json& parameters) {
    const auto input_it = parameters.find("input_string");
    if (input_it == parameters.end()) {
        return parameter_error("Missing required parameter: input_string",
                               "missing_parameter");
    }
    if (!input_it->is_string()) {
        return parameter_error("input_string must be a string", "invalid_parameter");
    }
    const auto lenses_it = parameters.find("lenses");
    if (lenses_it == parameters.end()) {
        return parameter_error("Missing required parameter: lenses", "missing_parameter");
    }
    if (!lenses_it->is_array()) {
        return parameter_error("lenses must be an array of strings", "invalid_parameter");
    }

    LensRequest request;
    request.input_string = input_it->get<std::string>();
    for (const auto& lens : *lenses_it) {
        if (!lens.is_string()) {
            return parameter_error("lenses must be an array of strings",
                                   "invalid_parameter");
        }
        request.lenses.push_back(lens.get<std::string>());
    }
    return request;
}

core::errors::Result<SchemaRequest> read_schema_request(const json& parameters) {
    const auto object_it = parameters.find("json_object");
    if (object_it == parameters.end()) {
        return parameter_error("Missing required parameter: json_object",
                               "missing_parameter");
    }
    const auto schema_it = parameters.find("json_schema");
    if (schema_it == parameters.end()) {
        return parameter_error("Missing required parameter: json_schema",
                               "missing_parameter");
    }
    return SchemaRequest{*object_it, *schema_it};
}

ToolHost::ToolHost(const DocumentEngine& engine, validation::ValidatorCache& validators,
                   core::config::ToolConfig tool_config)
    : engine_(engine),
      validators_(validators),
      policy_guard_(std::move(tool_config)) {}

core::errors::Result<json> ToolHost::execute(const ExecuteRequest& request) const {
    const auto started = std::chrono::steady_clock::now();

    auto variable_count = policy_guard_.validate_variables(request.variables);
    if (core::errors::is_error(variable_count)) {
        return core::errors::get_error(variable_count);
    }

    std::string source = request.facet_source;
    if (core::errors::get_value(variable_count) > 0) {
        source = substitute(source, request.variables);
    }

    auto checked = policy_guard_.validate_facet_source(source);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    if (is_cancelled(request.cancel_token)) {
        return ServiceError{ErrorCategory::Cancelled,
                            "Document execution cancelled before start.",
                            "dispatch_cancelled"};
    }

    auto executed = engine_.execute(source);
    if (core::errors::is_error(executed)) {
        return core::errors::get_error(executed);
    }

    json document = core::errors::get_value(executed);
    const auto ended = std::chrono::steady_clock::now();
    document["_meta"] = {
        {"execution_time_ms",
         std::chrono::duration<double, std::milli>(ended - started).count()},
        {"server", kServerName},
    };
    return document;
}

core::errors::Result<json> ToolHost::apply_lenses(const LensRequest& request) const {
    auto allowed = policy_guard_.validate_lens_chain(request.lenses);
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }

    auto applied =
        apply_lens_chain(request.input_string, request.lenses, request.cancel_token);
    if (core::errors::is_error(applied)) {
        return core::errors::get_error(applied);
    }
    return json(core::errors::get_value(applied));
}

core::errors::Result<json> ToolHost::validate_schema(const SchemaRequest& request) const {
    if (!request.json_schema.is_object() && !request.json_schema.is_boolean()) {
        return ServiceError{ErrorCategory::Schema,
                            "Invalid schema: json_schema must be an object",
                            "invalid_schema"};
    }

    auto validator = validators_.get_or_compile(request.json_schema);
    if (core::errors::is_error(validator)) {
        return core::errors::get_error(validator);
    }

    const auto outcome = core::errors::get_value(validator)->validate(request.json_object);
    json payload;
    payload["valid"] = outcome.valid;
    payload["errors"] = outcome.valid ? json(nullptr) : json(outcome.errors);
    return payload;
}

}  // namespace facetmcp::tools
