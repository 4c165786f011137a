#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/continuity_errors.hpp"

namespace continuity::protocol {

    constexpr const char* kProtocolVersion = "2024-11-05";
    constexpr const char* kServerName = "context-continuity";
    constexpr const char* kServerVersion = "1.0.0";

    // One inbound JSON-RPC 2.0 message. Notifications carry no id.
    struct Request {
        nlohmann::json id;
        bool is_notification = false;
        std::string method;
        nlohmann::json params = nlohmann::json::object();
    };

    // The dispatcher's answer to one request; id always mirrors the request's id.
    struct Response {
        nlohmann::json id;
        core::errors::Result<nlohmann::json> outcome;
    };

    // Step 1: bytes -> JSON (ProtocolParseError).
    core::errors::Result<nlohmann::json> parse_frame(const std::string& line);

    // Step 2: JSON -> Request (InvalidRequest).
    core::errors::Result<Request> parse_request(const nlohmann::json& frame);

    nlohmann::json make_result(const nlohmann::json& id, const nlohmann::json& result);
    nlohmann::json make_error(const nlohmann::json& id, const core::errors::ContinuityError& error);

    // MCP tools/call result: text content plus the structured payload.
    nlohmann::json make_tool_content(const nlohmann::json& payload);

    // Encodes a tools/call Response as a full JSON-RPC frame.
    nlohmann::json encode_tool_response(const Response& response);

} // namespace continuity::protocol
