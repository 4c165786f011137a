#include "engine/records.hpp"

#include <cmath>

namespace continuity::engine {

using nlohmann::json;

namespace {

std::string string_field(const json& in, const char* key) {
    auto it = in.find(key);
    if (it == in.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

double number_field(const json& in, const char* key) {
    auto it = in.find(key);
    if (it == in.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

std::vector<std::string> string_list_field(const json& in, const char* key) {
    std::vector<std::string> values;
    auto it = in.find(key);
    if (it == in.end() || !it->is_array()) {
        return values;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

}  // namespace

void to_json(json& out, const Activity& activity) {
    out = json{{"id", activity.id},
               {"timestamp", activity.timestamp},
               {"activity_type", activity.activity_type},
               {"app_name", activity.app_name},
               {"window_title", activity.window_title},
               {"file_path", activity.file_path},
               {"metadata", activity.metadata}};
}

void from_json(const json& in, Activity& activity) {
    activity.id = string_field(in, "id");
    activity.timestamp = number_field(in, "timestamp");
    activity.activity_type = string_field(in, "activity_type");
    activity.app_name = string_field(in, "app_name");
    activity.window_title = string_field(in, "window_title");
    activity.file_path = string_field(in, "file_path");
    auto it = in.find("metadata");
    activity.metadata = (it != in.end() && it->is_object()) ? *it : json::object();
}

void to_json(json& out, const WorkContext& context) {
    out = json{{"id", context.id},
               {"name", context.name},
               {"description", context.description},
               {"tags", context.tags},
               {"created_at", context.created_at},
               {"last_active", context.last_active}};
}

void to_json(json& out, const SearchHit& hit) {
    out = json{{"activity_id", hit.activity_id},
               {"document", hit.document},
               {"score", hit.score},
               {"metadata", hit.metadata}};
}

void from_json(const json& in, SearchHit& hit) {
    hit.activity_id = string_field(in, "activity_id");
    hit.document = string_field(in, "document");
    hit.score = number_field(in, "score");
    auto it = in.find("metadata");
    hit.metadata = (it != in.end() && it->is_object()) ? *it : json::object();
}

void to_json(json& out, const Prediction& prediction) {
    out = json{{"activity_id", prediction.activity_id},
               {"description", prediction.description},
               {"app_name", prediction.app_name},
               {"file_path", prediction.file_path},
               {"confidence", prediction.confidence},
               {"reason", prediction.reason}};
}

void from_json(const json& in, Prediction& prediction) {
    prediction.activity_id = string_field(in, "activity_id");
    prediction.description = string_field(in, "description");
    prediction.app_name = string_field(in, "app_name");
    prediction.file_path = string_field(in, "file_path");
    prediction.confidence = number_field(in, "confidence");
    prediction.reason = string_field(in, "reason");
}

void to_json(json& out, const ContextSuggestions& suggestions) {
    out = json{{"files", suggestions.files},
               {"apps", suggestions.apps},
               {"next_actions", suggestions.next_actions}};
}

void from_json(const json& in, ContextSuggestions& suggestions) {
    suggestions.files = string_list_field(in, "files");
    suggestions.apps = string_list_field(in, "apps");
    suggestions.next_actions = string_list_field(in, "next_actions");
}

void to_json(json& out, const RelatedActivity& related) {
    out = json{{"activity", related.activity},
               {"distance", related.distance},
               {"path", related.path},
               {"weight", related.weight}};
}

void from_json(const json& in, RelatedActivity& related) {
    auto it = in.find("activity");
    if (it != in.end() && it->is_object()) {
        related.activity = it->get<Activity>();
    }
    // Hop counts may arrive as floats (3.0); a missing or non-numeric distance is malformed.
    related.distance = std::llround(in.at("distance").get<double>());
    related.path = string_list_field(in, "path");
    related.weight = number_field(in, "weight");
}

json section_to_json(const StatsSection& section) {
    if (const auto* unavailable = std::get_if<StoreUnavailable>(&section)) {
        return json{{"available", false}, {"error", unavailable->reason}};
    }
    json payload = std::get<json>(section);
    if (!payload.is_object()) {
        payload = json{{"value", payload}};
    }
    payload["available"] = true;
    return payload;
}

}  // namespace continuity::engine
