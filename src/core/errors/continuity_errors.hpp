#pragma once
#include <string>
#include <variant>

namespace continuity::core::errors {

    // 1. Typed error kinds surfaced to the caller
    enum class ErrorKind {
        UnknownTool,        // No tool registered under the requested name
        InvalidParams,      // Missing, mistyped or out-of-range tool argument
        NotFound,           // E.g., unknown activity id for graph traversal
        Timeout,            // Handler exceeded its execution budget
        HandlerFailure,     // External store fault raised inside a handler
        ProtocolParseError, // Inbound frame is not valid JSON
        InvalidRequest,     // Valid JSON but not a JSON-RPC 2.0 request
        MethodNotFound,     // Session method the server does not implement
        DuplicateTool,      // Registry already holds a tool with that name
        Config,             // Command line or engine configuration is unusable
        Internal            // Logic bug or I/O failure inside this process
    };

    // The standardized error payload
    struct ContinuityError {
        ErrorKind kind;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";   // Helpful tips for the operator
        std::string store = "";  // Which external store failed, if any
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a ContinuityError.
    template <typename T>
    using Result = std::variant<T, ContinuityError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ContinuityError>(result);
    }

    template <typename T>
    const ContinuityError& get_error(const Result<T>& result) {
        return std::get<ContinuityError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline ContinuityError store_failure(const std::string& store, const std::string& message) {
        return ContinuityError{ErrorKind::HandlerFailure, message, "store_failure", "", store};
    }

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::UnknownTool:        return "UnknownTool";
            case ErrorKind::InvalidParams:      return "InvalidParams";
            case ErrorKind::NotFound:           return "NotFound";
            case ErrorKind::Timeout:            return "Timeout";
            case ErrorKind::HandlerFailure:     return "HandlerFailure";
            case ErrorKind::ProtocolParseError: return "ProtocolParseError";
            case ErrorKind::InvalidRequest:     return "InvalidRequest";
            case ErrorKind::MethodNotFound:     return "MethodNotFound";
            case ErrorKind::DuplicateTool:      return "DuplicateTool";
            case ErrorKind::Config:             return "Config";
            case ErrorKind::Internal:           return "Internal";
            default: return "Unknown";
        }
    }

    // 3. JSON-RPC 2.0 error codes; -32000..-32099 are server-defined.
    inline int to_jsonrpc_code(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::ProtocolParseError: return -32700;
            case ErrorKind::InvalidRequest:     return -32600;
            case ErrorKind::MethodNotFound:
            case ErrorKind::UnknownTool:        return -32601;
            case ErrorKind::InvalidParams:      return -32602;
            case ErrorKind::HandlerFailure:     return -32000;
            case ErrorKind::Timeout:            return -32001;
            case ErrorKind::NotFound:           return -32002;
            default: return -32603;
        }
    }

} // namespace continuity::core::errors
