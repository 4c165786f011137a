#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/continuity_errors.hpp"

namespace continuity::protocol {

    enum class ParamType {
        Integer,
        Number,
        String,
        Boolean,
        StringArray
    };

    // One declared tool parameter. A null default_value means "no default".
    struct ParamSpec {
        std::string name;
        ParamType type;
        bool required = false;
        nlohmann::json default_value = nullptr;
        std::string description;
        std::vector<std::string> allowed_values;  // enum constraint for strings
        bool non_empty = false;                   // reject "" and whitespace-only strings
    };

    // What shape the handler's payload takes; list shapes name their list field.
    enum class ResultShape {
        List,
        Grouped,
        Record,
        Aggregate,
        Count
    };

    // Normalized, validated arguments handed to a handler.
    class ToolArguments {
    public:
        explicit ToolArguments(nlohmann::json values = nlohmann::json::object(),
                               std::shared_ptr<std::atomic_bool> cancel_token = nullptr)
            : values_(std::move(values)), cancel_token_(std::move(cancel_token)) {}

        bool has(const std::string& name) const { return values_.contains(name); }
        std::int64_t get_int(const std::string& name) const { return values_.at(name).get<std::int64_t>(); }
        std::string get_string(const std::string& name) const { return values_.at(name).get<std::string>(); }
        std::vector<std::string> get_string_list(const std::string& name) const {
            return values_.at(name).get<std::vector<std::string>>();
        }

        // True once the dispatcher has given up on this request.
        bool cancelled() const { return cancel_token_ && cancel_token_->load(); }

        const nlohmann::json& values() const { return values_; }

    private:
        nlohmann::json values_;
        std::shared_ptr<std::atomic_bool> cancel_token_;
    };

    using ToolHandler =
        std::function<core::errors::Result<nlohmann::json>(const ToolArguments&)>;

    struct ToolDescriptor {
        std::string name;
        std::string description;
        std::vector<ParamSpec> params;
        bool strict = false;  // reject undeclared arguments instead of ignoring them
        ResultShape shape = ResultShape::Record;
        std::string list_field;  // for ResultShape::List
        ToolHandler handler;
    };

    // A parsed tools/call request.
    struct ToolCall {
        nlohmann::json id;
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    inline std::string to_string(const ParamType type) {
        switch (type) {
            case ParamType::Integer: return "integer";
            case ParamType::Number: return "number";
            case ParamType::String: return "string";
            case ParamType::Boolean: return "boolean";
            case ParamType::StringArray: return "array";
            default: return "unknown";
        }
    }

} // namespace continuity::protocol
