#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/continuity_errors.hpp"
#include "engine/collaborators.hpp"
#include "policy/privacy_filter.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace continuity::tools {

struct ToolLimits {
    std::int64_t max_graph_depth = 5;   // traversal ceiling; deeper requests are clamped
    double min_confidence = 0.3;        // predictions below this are dropped
    std::int64_t max_list_limit = 1000; // larger limits are clamped
};

// Handlers for the context tools. Each one is a thin adapter over a single
// engine collaborator; validation of declared parameters has already happened
// in the dispatcher, these methods enforce the remaining value rules.
class ContextTools {
public:
    ContextTools(engine::EngineHandles engine,
                 std::shared_ptr<policy::PrivacyFilter> privacy,
                 ToolLimits limits = {});

    core::errors::Result<nlohmann::json> recent_activities(
        const protocol::ToolArguments& args) const;
    core::errors::Result<nlohmann::json> search(const protocol::ToolArguments& args) const;
    core::errors::Result<nlohmann::json> predict(const protocol::ToolArguments& args) const;
    core::errors::Result<nlohmann::json> suggestions(const protocol::ToolArguments& args) const;
    core::errors::Result<nlohmann::json> related(const protocol::ToolArguments& args) const;
    core::errors::Result<nlohmann::json> stats(const protocol::ToolArguments& args) const;
    core::errors::Result<nlohmann::json> list_contexts(const protocol::ToolArguments& args) const;
    core::errors::Result<nlohmann::json> cleanup(const protocol::ToolArguments& args) const;
    core::errors::Result<nlohmann::json> privacy_blacklist(
        const protocol::ToolArguments& args) const;
    core::errors::Result<nlohmann::json> create_context(
        const protocol::ToolArguments& args) const;

    const ToolLimits& limits() const { return limits_; }

private:
    core::errors::Result<std::int64_t> bounded_limit(const protocol::ToolArguments& args,
                                                     const std::string& name) const;

    engine::EngineHandles engine_;
    std::shared_ptr<policy::PrivacyFilter> privacy_;
    ToolLimits limits_;
};

// Registers all ten context tools; fails on the first registry error.
core::errors::Result<std::size_t> register_context_tools(
    ToolRegistry& registry, std::shared_ptr<const ContextTools> tools);

}  // namespace continuity::tools
