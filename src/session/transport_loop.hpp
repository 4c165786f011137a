#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/jsonrpc.hpp"
#include "runtime/dispatcher.hpp"
#include "runtime/worker_pool.hpp"
#include "session/request_tracker.hpp"
#include "session/response_writer.hpp"
#include "tools/tool_registry.hpp"

namespace continuity::session {

struct LoopOptions {
    std::size_t intake_workers = 4;  // 0 dispatches tools/call inline, in arrival order
};

// Reads newline-delimited JSON-RPC frames, answers session methods itself and
// hands tools/call to the dispatcher.
class TransportLoop {
public:
    TransportLoop(const runtime::Dispatcher& dispatcher, const tools::ToolRegistry& registry,
                  ResponseWriter& writer, LoopOptions options = {});

    // Runs until the input closes, a shutdown request arrives, or
    // request_shutdown() is called. In-flight calls are drained before returning.
    int run(std::istream& in);

    // Safe to call from a signal handler.
    void request_shutdown() { shutdown_.store(true); }
    bool shutdown_requested() const { return shutdown_.load(); }

    const RequestTracker& tracker() const { return tracker_; }
    bool sequential() const { return !intake_; }

private:
    void handle_line(const std::string& line);
    void handle_request(const protocol::Request& request);
    void handle_tool_call(const protocol::Request& request);
    void run_tool_call(const protocol::ToolCall& call, bool respond);
    void emit(const nlohmann::json& frame);
    void wait_for_drain();

    const runtime::Dispatcher& dispatcher_;
    const tools::ToolRegistry& registry_;
    ResponseWriter& writer_;
    RequestTracker tracker_;
    std::atomic_bool shutdown_{false};

    std::mutex pending_mutex_;
    std::condition_variable drained_;
    std::size_t pending_ = 0;

    // Declared last so queued intake tasks finish before the state they touch goes away.
    std::unique_ptr<runtime::WorkerPool> intake_;
};

}  // namespace continuity::session
