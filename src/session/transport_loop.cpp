#include "session/transport_loop.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace continuity::session {

using core::errors::ContinuityError;
using core::errors::ErrorKind;
using nlohmann::json;
using protocol::Request;
using protocol::ToolCall;

namespace {

// Releases one pending slot when an intake task ends, however it ends.
class PendingSlot {
public:
    PendingSlot(std::mutex& mutex, std::condition_variable& drained, std::size_t& pending)
        : mutex_(mutex), drained_(drained), pending_(pending) {}

    ~PendingSlot() {
        std::lock_guard<std::mutex> lock(mutex_);
        --pending_;
        drained_.notify_all();
    }

    PendingSlot(const PendingSlot&) = delete;
    PendingSlot& operator=(const PendingSlot&) = delete;

private:
    std::mutex& mutex_;
    std::condition_variable& drained_;
    std::size_t& pending_;
};

// Best-effort id recovery for frames that fail request validation.
json salvage_id(const json& frame) {
    if (!frame.is_object()) {
        return nullptr;
    }
    auto id = frame.find("id");
    if (id != frame.end() && (id->is_string() || id->is_number_integer())) {
        return *id;
    }
    return nullptr;
}

}  // namespace

TransportLoop::TransportLoop(const runtime::Dispatcher& dispatcher,
                             const tools::ToolRegistry& registry, ResponseWriter& writer,
                             LoopOptions options)
    : dispatcher_(dispatcher), registry_(registry), writer_(writer) {
    if (options.intake_workers > 0) {
        intake_ = std::make_unique<runtime::WorkerPool>(options.intake_workers);
    }
}

int TransportLoop::run(std::istream& in) {
    LOG_INFO(std::string("TransportLoop: serving ") + std::to_string(registry_.size()) +
             " tools (" + (sequential() ? "sequential" : "concurrent") + ")");

    std::string line;
    while (!shutdown_.load() && std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        handle_line(line);
    }

    if (shutdown_.load()) {
        LOG_INFO("TransportLoop: shutdown requested");
    } else {
        LOG_INFO("TransportLoop: input closed");
    }
    wait_for_drain();
    LOG_INFO("TransportLoop: answered " + std::to_string(tracker_.answered_count()) +
             " tool calls");
    return 0;
}

void TransportLoop::handle_line(const std::string& line) {
    auto frame = protocol::parse_frame(line);
    if (core::errors::is_error(frame)) {
        LOG_WARN("TransportLoop: dropping unparseable frame (" +
                 std::to_string(line.size()) + " bytes)");
        emit(protocol::make_error(nullptr, core::errors::get_error(frame)));
        return;
    }

    auto request = protocol::parse_request(core::errors::get_value(frame));
    if (core::errors::is_error(request)) {
        emit(protocol::make_error(salvage_id(core::errors::get_value(frame)),
                                  core::errors::get_error(request)));
        return;
    }
    handle_request(core::errors::get_value(request));
}

void TransportLoop::handle_request(const Request& request) {
    LOG_DEBUG("TransportLoop: method " + request.method);

    if (request.method == "tools/call") {
        handle_tool_call(request);
        return;
    }
    if (request.is_notification) {
        // notifications/initialized and friends need no answer.
        return;
    }

    if (request.method == "initialize") {
        json result = {{"protocolVersion", protocol::kProtocolVersion},
                       {"capabilities", {{"tools", {{"listChanged", false}}}}},
                       {"serverInfo",
                        {{"name", protocol::kServerName},
                         {"version", protocol::kServerVersion}}}};
        emit(protocol::make_result(request.id, result));
    } else if (request.method == "tools/list") {
        emit(protocol::make_result(request.id, {{"tools", registry_.describe()}}));
    } else if (request.method == "ping") {
        emit(protocol::make_result(request.id, json::object()));
    } else if (request.method == "shutdown") {
        emit(protocol::make_result(request.id, json::object()));
        request_shutdown();
    } else {
        emit(protocol::make_error(
            request.id, ContinuityError{ErrorKind::MethodNotFound,
                                        "Method not found: " + request.method,
                                        "method_not_found"}));
    }
}

void TransportLoop::handle_tool_call(const Request& request) {
    const json& params = request.params;
    auto name = params.is_object() ? params.find("name") : params.end();
    if (name == params.end() || !name->is_string()) {
        if (!request.is_notification) {
            emit(protocol::make_error(
                request.id, ContinuityError{ErrorKind::InvalidParams,
                                            "tools/call requires a string 'name'",
                                            "missing_tool_name"}));
        }
        return;
    }

    ToolCall call;
    call.id = request.id;
    call.name = name->get<std::string>();
    auto arguments = params.find("arguments");
    call.arguments = arguments == params.end() ? json::object() : *arguments;

    const bool respond = !request.is_notification;
    if (respond) {
        auto begun = tracker_.begin(call.id.dump());
        if (core::errors::is_error(begun)) {
            LOG_WARN("TransportLoop: " + core::errors::get_error(begun).message);
            emit(protocol::make_error(call.id, core::errors::get_error(begun)));
            return;
        }
    }

    if (!intake_) {
        run_tool_call(call, respond);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        ++pending_;
    }
    // The returned future is not kept; completion is tracked through pending_.
    static_cast<void>(intake_->submit([this, call, respond]() {
        PendingSlot slot(pending_mutex_, drained_, pending_);
        run_tool_call(call, respond);
    }));
}

void TransportLoop::run_tool_call(const ToolCall& call, const bool respond) {
    const protocol::Response response = dispatcher_.dispatch(call);
    if (!respond) {
        return;
    }
    // Release the id first so a client reusing it after the answer is not rejected.
    auto finished = tracker_.finish(call.id.dump());
    if (core::errors::is_error(finished)) {
        LOG_ERROR("TransportLoop: " + core::errors::get_error(finished).message);
        return;
    }
    emit(protocol::encode_tool_response(response));
}

void TransportLoop::emit(const json& frame) {
    auto written = writer_.write(frame);
    if (core::errors::is_error(written)) {
        LOG_WARN("TransportLoop: response for id " + frame.value("id", json()).dump() +
                 " was not delivered");
    }
}

void TransportLoop::wait_for_drain() {
    std::unique_lock<std::mutex> lock(pending_mutex_);
    drained_.wait(lock, [this]() { return pending_ == 0; });
}

}  // namespace continuity::session
