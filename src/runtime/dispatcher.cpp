#include "runtime/dispatcher.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include "core/logging/logger.hpp"
#include "engine/collaborators.hpp"

namespace continuity::runtime {

using core::errors::ContinuityError;
using core::errors::ErrorKind;
using nlohmann::json;
using protocol::ParamSpec;
using protocol::ParamType;
using protocol::Response;
using protocol::ResultShape;
using protocol::ToolArguments;
using protocol::ToolCall;
using protocol::ToolDescriptor;

namespace {

ContinuityError invalid_param(const std::string& message, const std::string& code) {
    return ContinuityError{ErrorKind::InvalidParams, message, code};
}

bool matches_type(const ParamType type, const json& value) {
    switch (type) {
        case ParamType::Integer:
            return value.is_number_integer();
        case ParamType::Number:
            return value.is_number();
        case ParamType::String:
            return value.is_string();
        case ParamType::Boolean:
            return value.is_boolean();
        case ParamType::StringArray:
            return value.is_array() &&
                   std::all_of(value.begin(), value.end(),
                               [](const json& item) { return item.is_string(); });
        default:
            return false;
    }
}

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](const unsigned char c) { return std::isspace(c) != 0; });
}

core::errors::Result<json> check_value(const ParamSpec& spec, const json& value) {
    if (!matches_type(spec.type, value)) {
        return invalid_param("Parameter '" + spec.name + "' must be of type " +
                                 protocol::to_string(spec.type),
                             "invalid_type");
    }
    if (spec.type == ParamType::String) {
        const auto& text = value.get_ref<const std::string&>();
        if (spec.non_empty && is_blank(text)) {
            return invalid_param("Parameter '" + spec.name + "' cannot be empty",
                                 "empty_parameter");
        }
        if (!spec.allowed_values.empty() &&
            std::find(spec.allowed_values.begin(), spec.allowed_values.end(), text) ==
                spec.allowed_values.end()) {
            return invalid_param("Parameter '" + spec.name + "' has unsupported value '" +
                                     text + "'",
                                 "value_not_allowed");
        }
    }
    return value;
}

}  // namespace

core::errors::Result<json> normalize_arguments(const ToolDescriptor& descriptor,
                                               const json& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        return invalid_param("Tool arguments must be a JSON object", "invalid_arguments");
    }
    const json provided = arguments.is_null() ? json::object() : arguments;

    json normalized = json::object();
    for (const auto& spec : descriptor.params) {
        auto it = provided.find(spec.name);
        if (it == provided.end() || it->is_null()) {
            if (spec.required) {
                return invalid_param("Missing required parameter '" + spec.name + "'",
                                     "missing_parameter");
            }
            if (!spec.default_value.is_null()) {
                normalized[spec.name] = spec.default_value;
            }
            continue;
        }
        auto checked = check_value(spec, *it);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
        normalized[spec.name] = *it;
    }

    for (const auto& entry : provided.items()) {
        const std::string& name = entry.key();
        if (normalized.contains(name)) {
            continue;
        }
        const bool declared =
            std::any_of(descriptor.params.begin(), descriptor.params.end(),
                        [&name](const ParamSpec& spec) { return spec.name == name; });
        if (!declared && descriptor.strict) {
            return invalid_param("Unknown parameter '" + name + "' for " + descriptor.name,
                                 "unknown_parameter");
        }
    }
    return normalized;
}

Dispatcher::Dispatcher(const tools::ToolRegistry& registry,
                       const policy::PrivacyFilter& privacy, WorkerPool& pool,
                       DispatchOptions options)
    : registry_(registry), privacy_(privacy), pool_(pool), options_(options) {}

Response Dispatcher::dispatch(const ToolCall& call) const {
    const auto started = std::chrono::steady_clock::now();

    // 1. Lookup
    auto found = registry_.lookup(call.name);
    if (core::errors::is_error(found)) {
        LOG_WARN("Dispatcher: unknown tool '" + call.name + "'");
        return Response{call.id, core::errors::get_error(found)};
    }
    const ToolDescriptor& descriptor = *core::errors::get_value(found);

    // 2. Validation
    auto normalized = normalize_arguments(descriptor, call.arguments);
    if (core::errors::is_error(normalized)) {
        LOG_WARN("Dispatcher: " + descriptor.name + " rejected arguments: " +
                 core::errors::get_error(normalized).message);
        return Response{call.id, core::errors::get_error(normalized)};
    }

    // 3. Bounded execution. The task owns copies of everything it touches so a
    // timed-out handler can finish after this call returns.
    auto cancel_token = std::make_shared<std::atomic_bool>(false);
    const ToolArguments args(core::errors::get_value(normalized), cancel_token);
    const auto handler = descriptor.handler;
    const std::string tool = descriptor.name;
    auto future = pool_.submit([handler, args, cancel_token, tool]()
                                   -> core::errors::Result<json> {
        if (cancel_token->load()) {
            return ContinuityError{ErrorKind::Timeout, tool + " cancelled before start",
                                   "cancelled"};
        }
        // 4. Faults become HandlerFailure; store faults keep their store name.
        try {
            return handler(args);
        } catch (const engine::StoreError& e) {
            return core::errors::store_failure(e.store(), e.what());
        } catch (const std::exception& e) {
            return ContinuityError{ErrorKind::HandlerFailure, tool + " failed: " + e.what(),
                                   "handler_exception"};
        } catch (...) {
            return ContinuityError{ErrorKind::HandlerFailure, tool + " failed: unknown fault",
                                   "handler_exception"};
        }
    });

    const auto budget = std::chrono::milliseconds(options_.handler_timeout_ms);
    if (future.wait_for(budget) != std::future_status::ready) {
        cancel_token->store(true);
        LOG_WARN("Dispatcher: " + tool + " exceeded " +
                 std::to_string(options_.handler_timeout_ms) + " ms budget");
        return Response{call.id,
                        ContinuityError{ErrorKind::Timeout,
                                        tool + " timed out after " +
                                            std::to_string(options_.handler_timeout_ms) + " ms",
                                        "handler_timeout"}};
    }

    auto outcome = future.get();
    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        LOG_WARN("Dispatcher: " + tool + " failed [" + error.code + "]" +
                 (error.store.empty() ? "" : " store=" + error.store) + ": " + error.message);
        return Response{call.id, error};
    }

    // 5. Privacy redaction
    json payload = core::errors::get_value(outcome);
    const std::size_t removed = privacy_.redact(payload);
    if (descriptor.shape == ResultShape::List && payload.is_object()) {
        auto list = payload.find(descriptor.list_field);
        if (list != payload.end() && list->is_array()) {
            const std::size_t count = list->size();
            payload["count"] = count;
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    LOG_DEBUG("Dispatcher: " + tool + " ok in " + std::to_string(elapsed) + " ms, redacted " +
              std::to_string(removed));
    return Response{call.id, payload};
}

}  // namespace continuity::runtime
