#include "protocol/jsonrpc.hpp"

namespace continuity::protocol {

using core::errors::ContinuityError;
using core::errors::ErrorKind;
using nlohmann::json;

core::errors::Result<json> parse_frame(const std::string& line) {
    json frame = json::parse(line, nullptr, false);
    if (frame.is_discarded()) {
        return ContinuityError{ErrorKind::ProtocolParseError, "Parse error: invalid JSON",
                               "parse_error"};
    }
    return frame;
}

core::errors::Result<Request> parse_request(const json& frame) {
    if (!frame.is_object()) {
        return ContinuityError{ErrorKind::InvalidRequest, "Request must be a JSON object",
                               "invalid_request"};
    }
    auto version = frame.find("jsonrpc");
    if (version == frame.end() || *version != "2.0") {
        return ContinuityError{ErrorKind::InvalidRequest, "Missing or invalid jsonrpc version",
                               "invalid_request"};
    }
    auto method = frame.find("method");
    if (method == frame.end() || !method->is_string()) {
        return ContinuityError{ErrorKind::InvalidRequest, "Missing or invalid method",
                               "invalid_request"};
    }

    Request request;
    request.method = method->get<std::string>();

    auto id = frame.find("id");
    if (id == frame.end()) {
        request.is_notification = true;
    } else if (id->is_string() || id->is_number_integer() || id->is_null()) {
        request.id = *id;
    } else {
        return ContinuityError{ErrorKind::InvalidRequest,
                               "Request id must be a string or an integer", "invalid_request"};
    }

    auto params = frame.find("params");
    if (params != frame.end() && !params->is_null()) {
        if (!params->is_object() && !params->is_array()) {
            return ContinuityError{ErrorKind::InvalidRequest,
                                   "params must be an object or an array", "invalid_request"};
        }
        request.params = *params;
    }
    return request;
}

json make_result(const json& id, const json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json make_error(const json& id, const ContinuityError& error) {
    json data = {{"kind", core::errors::to_string(error.kind)}, {"code", error.code}};
    if (!error.store.empty()) {
        data["store"] = error.store;
    }
    return {{"jsonrpc", "2.0"},
            {"id", id},
            {"error",
             {{"code", core::errors::to_jsonrpc_code(error.kind)},
              {"message", error.message},
              {"data", data}}}};
}

json make_tool_content(const json& payload) {
    json content = json::array();
    const std::string text = payload.dump(2, ' ', false, json::error_handler_t::replace);
    content.push_back({{"type", "text"}, {"text", text}});
    return {{"content", content}, {"structuredContent", payload}, {"isError", false}};
}

json encode_tool_response(const Response& response) {
    if (core::errors::is_error(response.outcome)) {
        return make_error(response.id, core::errors::get_error(response.outcome));
    }
    return make_result(response.id, make_tool_content(core::errors::get_value(response.outcome)));
}

} // namespace continuity::protocol
