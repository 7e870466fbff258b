#pragma once
#include <string>
#include <variant>

namespace facetmcp::core::errors {

    // Typed error categories, one per failure kind the server distinguishes
    enum class ErrorCategory {
        Decode,     // Malformed envelope; the connection survives
        NotFound,   // Unknown tool or unknown message type
        Parameter,  // Tool parameters missing or of the wrong shape
        Document,   // Document engine rejected the source
        Lens,       // Unknown lens or malformed lens spec
        Schema,     // The schema itself is not a valid schema
        Limit,      // A configured size or count limit was exceeded
        Cancelled,  // The owning connection went away mid-dispatch
        Transport,  // Socket level failure
        Config,     // Bad CLI flag or environment value
        Internal    // Bug in the dispatch machinery
    };

    struct ServiceError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    template <typename T>
    using Result = std::variant<T, ServiceError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ServiceError>(result);
    }

    template <typename T>
    const ServiceError& get_error(const Result<T>& result) {
        return std::get<ServiceError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    // Name reported in the wire "error_type" field.
    inline std::string error_type_name(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Decode:
                return "DecodeError";
            case ErrorCategory::NotFound:
                return "NotFoundError";
            case ErrorCategory::Parameter:
                return "ParameterError";
            case ErrorCategory::Document:
                return "DocumentError";
            case ErrorCategory::Lens:
                return "LensError";
            case ErrorCategory::Schema:
                return "SchemaError";
            case ErrorCategory::Limit:
                return "LimitError";
            case ErrorCategory::Cancelled:
                return "CancelledError";
            case ErrorCategory::Transport:
                return "TransportError";
            case ErrorCategory::Config:
                return "ConfigError";
            case ErrorCategory::Internal:
                return "InternalError";
        }
        return "InternalError";
    }

} // namespace facetmcp::core::errors
