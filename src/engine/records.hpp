#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace continuity::engine {

// One tracked user activity as stored in the activity log.
struct Activity {
    std::string id;
    double timestamp = 0.0;  // unix seconds
    std::string activity_type;
    std::string app_name;
    std::string window_title;
    std::string file_path;
    nlohmann::json metadata = nlohmann::json::object();
};

// A named work context ("refactor-api") grouping activities.
struct WorkContext {
    std::int64_t id = 0;
    std::string name;
    std::string description;
    std::vector<std::string> tags;
    double created_at = 0.0;
    double last_active = 0.0;
};

struct SearchHit {
    std::string activity_id;
    std::string document;
    double score = 0.0;
    nlohmann::json metadata = nlohmann::json::object();
};

struct Prediction {
    std::string activity_id;
    std::string description;
    std::string app_name;
    std::string file_path;
    double confidence = 0.0;
    std::string reason;
};

struct ContextSuggestions {
    std::vector<std::string> files;
    std::vector<std::string> apps;
    std::vector<std::string> next_actions;
};

struct RelatedActivity {
    Activity activity;
    std::int64_t distance = 0;
    std::vector<std::string> path;  // activity ids from the origin to this node
    double weight = 0.0;
};

// Per-store statistics: either the store's own counters or a marker that the
// store could not be reached.
struct StoreUnavailable {
    std::string reason;
};
using StatsSection = std::variant<nlohmann::json, StoreUnavailable>;

void to_json(nlohmann::json& out, const Activity& activity);
void from_json(const nlohmann::json& in, Activity& activity);
void to_json(nlohmann::json& out, const WorkContext& context);
void to_json(nlohmann::json& out, const SearchHit& hit);
void from_json(const nlohmann::json& in, SearchHit& hit);
void to_json(nlohmann::json& out, const Prediction& prediction);
void from_json(const nlohmann::json& in, Prediction& prediction);
void to_json(nlohmann::json& out, const ContextSuggestions& suggestions);
void from_json(const nlohmann::json& in, ContextSuggestions& suggestions);
void to_json(nlohmann::json& out, const RelatedActivity& related);
void from_json(const nlohmann::json& in, RelatedActivity& related);

nlohmann::json section_to_json(const StatsSection& section);

}  // namespace continuity::engine
