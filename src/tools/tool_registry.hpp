#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/continuity_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace continuity::tools {

// Closed set of tools, populated once at startup and sealed before the transport
// loop runs. After seal() the registry is read-only and lookups take no lock.
class ToolRegistry {
public:
    core::errors::Result<std::size_t> register_tool(protocol::ToolDescriptor descriptor);

    core::errors::Result<const protocol::ToolDescriptor*> lookup(const std::string& name) const;

    void seal() { sealed_ = true; }
    std::size_t size() const { return descriptors_.size(); }

    // Descriptors in registration order.
    const std::vector<protocol::ToolDescriptor>& list() const { return descriptors_; }

    // The tools/list payload: name, description and a JSON Schema per tool.
    nlohmann::json describe() const;

private:
    std::vector<protocol::ToolDescriptor> descriptors_;
    std::unordered_map<std::string, std::size_t> index_;
    bool sealed_ = false;
};

nlohmann::json input_schema(const protocol::ToolDescriptor& descriptor);

}  // namespace continuity::tools
