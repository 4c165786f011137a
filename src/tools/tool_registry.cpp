#include "tools/tool_registry.hpp"

#include <utility>

namespace continuity::tools {

using core::errors::ContinuityError;
using core::errors::ErrorKind;
using nlohmann::json;
using protocol::ToolDescriptor;

core::errors::Result<std::size_t> ToolRegistry::register_tool(ToolDescriptor descriptor) {
    if (sealed_) {
        return ContinuityError{ErrorKind::Internal,
                               "Registry is sealed; cannot register " + descriptor.name,
                               "registry_sealed"};
    }
    if (descriptor.name.empty() || !descriptor.handler) {
        return ContinuityError{ErrorKind::Internal,
                               "Tool descriptor needs a name and a handler.",
                               "invalid_descriptor"};
    }
    if (index_.find(descriptor.name) != index_.end()) {
        return ContinuityError{ErrorKind::DuplicateTool,
                               "Tool already registered: " + descriptor.name,
                               "duplicate_tool"};
    }

    index_.emplace(descriptor.name, descriptors_.size());
    descriptors_.push_back(std::move(descriptor));
    return descriptors_.size();
}

core::errors::Result<const ToolDescriptor*> ToolRegistry::lookup(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return ContinuityError{ErrorKind::UnknownTool, "Unknown tool: " + name, "unknown_tool"};
    }
    return &descriptors_[it->second];
}

json input_schema(const ToolDescriptor& descriptor) {
    json properties = json::object();
    json required = json::array();
    for (const auto& param : descriptor.params) {
        json property = {{"type", protocol::to_string(param.type)}};
        if (param.type == protocol::ParamType::StringArray) {
            property["items"] = {{"type", "string"}};
        }
        if (!param.description.empty()) {
            property["description"] = param.description;
        }
        if (!param.default_value.is_null()) {
            property["default"] = param.default_value;
        }
        if (!param.allowed_values.empty()) {
            property["enum"] = param.allowed_values;
        }
        if (param.non_empty) {
            property["minLength"] = 1;
        }
        properties[param.name] = property;
        if (param.required) {
            required.push_back(param.name);
        }
    }

    json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    if (descriptor.strict) {
        schema["additionalProperties"] = false;
    }
    return schema;
}

json ToolRegistry::describe() const {
    json tools = json::array();
    for (const auto& descriptor : list()) {
        tools.push_back({{"name", descriptor.name},
                         {"description", descriptor.description},
                         {"inputSchema", input_schema(descriptor)}});
    }
    return tools;
}

}  // namespace continuity::tools
