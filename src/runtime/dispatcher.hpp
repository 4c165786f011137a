#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/errors/continuity_errors.hpp"
#include "policy/privacy_filter.hpp"
#include "protocol/jsonrpc.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/worker_pool.hpp"
#include "tools/tool_registry.hpp"

namespace continuity::runtime {

struct DispatchOptions {
    std::uint32_t handler_timeout_ms = 30000;
};

// Checks raw tools/call arguments against a descriptor and returns them with
// defaults filled in. Absent or null arguments count as an empty object.
core::errors::Result<nlohmann::json> normalize_arguments(
    const protocol::ToolDescriptor& descriptor, const nlohmann::json& arguments);

// Routes one tools/call to its handler: lookup, validation, bounded execution on
// the worker pool, then privacy redaction of the payload.
class Dispatcher {
public:
    Dispatcher(const tools::ToolRegistry& registry, const policy::PrivacyFilter& privacy,
               WorkerPool& pool, DispatchOptions options = {});

    protocol::Response dispatch(const protocol::ToolCall& call) const;

private:
    const tools::ToolRegistry& registry_;
    const policy::PrivacyFilter& privacy_;
    WorkerPool& pool_;
    DispatchOptions options_;
};

}  // namespace continuity::runtime
