#include "runtime/dispatch_engine.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include "core/errors/exception_name.hpp"
#include "core/logging/logger.hpp"
#include "protocol/message_codec.hpp"

namespace facetmcp::runtime {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;
using protocol::Envelope;
using protocol::MessageType;
using protocol::ToolResult;
using tools::ToolId;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += separator;
        }
        out += item;
    }
    return out;
}

}  // namespace

DispatchEngine::DispatchEngine(const tools::ToolRegistry& registry,
                               const tools::ToolHost& host,
                               validation::ValidatorCache& validators,
                               DispatchOptions options)
    : registry_(registry), host_(host), validators_(validators), options_(options) {}

Envelope DispatchEngine::handle(const Envelope& request,
                                const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    Envelope response;
    switch (request.type) {
        case MessageType::ToolCall:
            response = handle_tool_call(request, cancel_token);
            break;
        case MessageType::ListTools:
            response = protocol::make_tools_list(registry_.list());
            break;
        case MessageType::ToolResult:
        case MessageType::ToolsList:
        case MessageType::Error:
        case MessageType::Ping:
        case MessageType::Pong:
        case MessageType::Unrecognized:
            LOG_WARN("Dispatch: unknown message type '" + request.type_name + "'");
            response = protocol::make_error("Unknown message type: " + request.type_name,
                                            core::errors::error_type_name(ErrorCategory::NotFound),
                                            registry_.names());
            break;
    }
    response.id = request.id;
    return response;
}

Envelope DispatchEngine::handle_tool_call(
    const Envelope& request, const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    auto call = protocol::read_tool_call(request);
    if (core::errors::is_error(call)) {
        const auto& err = core::errors::get_error(call);
        return protocol::make_error(err.message, core::errors::error_type_name(err.category));
    }
    const auto& tool_call = core::errors::get_value(call);

    auto resolved = registry_.resolve(tool_call.name);
    if (core::errors::is_error(resolved)) {
        const auto& err = core::errors::get_error(resolved);
        LOG_WARN("Dispatch: " + err.message);
        return protocol::make_error(err.message,
                                    core::errors::error_type_name(err.category),
                                    registry_.names(), suggest(tool_call.name));
    }

    const auto* tool = core::errors::get_value(resolved);
    const ToolResult result = run_tool(*tool, tool_call.parameters, cancel_token);
    if (!result.success) {
        LOG_INFO("Dispatch: tool '" + tool->name + "' failed [" + result.error_type +
                 "]: " + result.error_message);
    } else {
        LOG_DEBUG("Dispatch: tool '" + tool->name + "' completed");
    }
    return protocol::make_tool_result(tool_call.id, result);
}

ToolResult DispatchEngine::run_tool(const tools::ToolDescriptor& tool,
                                    const json& parameters,
                                    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    const auto started = std::chrono::steady_clock::now();
    ToolResult result;
    try {
        core::errors::Result<json> outcome = json();
        if (options_.validate_parameters) {
            auto checked = check_parameters(tool, parameters);
            if (core::errors::is_error(checked)) {
                outcome = core::errors::get_error(checked);
            } else {
                outcome = invoke(tool.id, parameters, cancel_token);
            }
        } else {
            outcome = invoke(tool.id, parameters, cancel_token);
        }

        if (core::errors::is_error(outcome)) {
            result = ToolResult::failed(core::errors::get_error(outcome));
        } else {
            result = ToolResult::ok(std::move(core::errors::get_value(outcome)));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatch: tool '" + tool.name + "' threw " +
                  core::errors::exception_type_name(e) + ": " + e.what());
        result = ToolResult::failed(
            ServiceError{ErrorCategory::Internal, e.what(), "handler_exception"});
    }

    const auto ended = std::chrono::steady_clock::now();
    result.duration_ms = std::chrono::duration<double, std::milli>(ended - started).count();
    return result;
}

core::errors::Result<json> DispatchEngine::invoke(
    const ToolId id, const json& parameters,
    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    switch (id) {
        case ToolId::Execute: {
            auto request = tools::read_execute_request(parameters);
            if (core::errors::is_error(request)) {
                return core::errors::get_error(request);
            }
            auto& execute_request = core::errors::get_value(request);
            execute_request.cancel_token = cancel_token;
            return host_.execute(execute_request);
        }
        case ToolId::ApplyLenses: {
            auto request = tools::read_lens_request(parameters);
            if (core::errors::is_error(request)) {
                return core::errors::get_error(request);
            }
            auto& lens_request = core::errors::get_value(request);
            lens_request.cancel_token = cancel_token;
            return host_.apply_lenses(lens_request);
        }
        case ToolId::ValidateSchema: {
            auto request = tools::read_schema_request(parameters);
            if (core::errors::is_error(request)) {
                return core::errors::get_error(request);
            }
            return host_.validate_schema(core::errors::get_value(request));
        }
    }
    return ServiceError{ErrorCategory::Internal, "Tool has no handler", "missing_handler"};
}

core::errors::Result<bool> DispatchEngine::check_parameters(const tools::ToolDescriptor& tool,
                                                            const json& parameters) const {
    auto validator = validators_.get_or_compile(tool.parameter_schema);
    if (core::errors::is_error(validator)) {
        const auto& err = core::errors::get_error(validator);
        return ServiceError{ErrorCategory::Internal,
                            "Parameter schema for '" + tool.name + "' is invalid: " +
                                err.message,
                            "bad_parameter_schema"};
    }

    const auto outcome = core::errors::get_value(validator)->validate(parameters);
    if (!outcome.valid) {
        return ServiceError{ErrorCategory::Parameter,
                            "Invalid parameters for '" + tool.name +
                                "': " + join(outcome.errors, "; "),
                            "invalid_parameters"};
    }
    return true;
}

std::vector<std::string> DispatchEngine::suggest(const std::string& unknown_name) const {
    const std::string needle = lowercase(unknown_name);
    std::vector<std::string> suggestions;
    if (needle.empty()) {
        return suggestions;
    }
    for (const auto& name : registry_.names()) {
        const std::string candidate = lowercase(name);
        const bool related = candidate.find(needle) != std::string::npos ||
                             needle.find(candidate) != std::string::npos ||
                             (needle.size() >= 3 && candidate.compare(0, 3, needle, 0, 3) == 0);
        if (related) {
            suggestions.push_back(name);
        }
    }
    return suggestions;
}

}  // namespace facetmcp::runtime
