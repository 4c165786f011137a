#include "tools/context_tools.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace continuity::tools {

using core::errors::ContinuityError;
using core::errors::ErrorKind;
using engine::StatsSection;
using engine::StoreUnavailable;
using nlohmann::json;
using protocol::ParamSpec;
using protocol::ParamType;
using protocol::ResultShape;
using protocol::ToolArguments;
using protocol::ToolDescriptor;

namespace {

ContinuityError cancelled_error(const std::string& tool) {
    return ContinuityError{ErrorKind::Timeout, tool + " was cancelled before completion.",
                           "cancelled"};
}

// Store stats never fail the stats tool; an unreachable store becomes a marker.
template <typename Store>
StatsSection collect_section(const char* store, const std::shared_ptr<Store>& handle) {
    if (!handle) {
        return StoreUnavailable{"not configured"};
    }
    try {
        return handle->stats();
    } catch (const std::exception& e) {
        LOG_WARN(std::string("context_stats: ") + store + " unavailable: " + e.what());
        return StoreUnavailable{e.what()};
    }
}

template <typename T>
void keep_first(std::vector<T>& items, const std::int64_t limit) {
    if (static_cast<std::int64_t>(items.size()) > limit) {
        items.resize(static_cast<std::size_t>(limit));
    }
}

}  // namespace

ContextTools::ContextTools(engine::EngineHandles engine,
                           std::shared_ptr<policy::PrivacyFilter> privacy, ToolLimits limits)
    : engine_(std::move(engine)), privacy_(std::move(privacy)), limits_(limits) {}

core::errors::Result<std::int64_t> ContextTools::bounded_limit(const ToolArguments& args,
                                                               const std::string& name) const {
    const std::int64_t requested = args.get_int(name);
    if (requested < 1) {
        return ContinuityError{ErrorKind::InvalidParams,
                               name + " must be at least 1, got " + std::to_string(requested),
                               "limit_out_of_range"};
    }
    return std::min(requested, limits_.max_list_limit);
}

core::errors::Result<json> ContextTools::recent_activities(const ToolArguments& args) const {
    const std::int64_t hours = args.get_int("hours");
    auto limit = bounded_limit(args, "limit");
    if (core::errors::is_error(limit)) {
        return core::errors::get_error(limit);
    }

    std::vector<engine::Activity> activities;
    if (hours > 0) {
        activities = engine_.activities->recent_activities(hours, core::errors::get_value(limit));
    }
    std::stable_sort(activities.begin(), activities.end(),
                     [](const engine::Activity& a, const engine::Activity& b) {
                         return a.timestamp > b.timestamp;
                     });
    keep_first(activities, core::errors::get_value(limit));

    return json{{"status", "success"},
                {"hours", hours},
                {"count", activities.size()},
                {"activities", activities}};
}

core::errors::Result<json> ContextTools::search(const ToolArguments& args) const {
    const std::string query = args.get_string("query");
    auto limit = bounded_limit(args, "limit");
    if (core::errors::is_error(limit)) {
        return core::errors::get_error(limit);
    }

    auto hits = engine_.embeddings->search(query, core::errors::get_value(limit));
    std::stable_sort(hits.begin(), hits.end(),
                     [](const engine::SearchHit& a, const engine::SearchHit& b) {
                         return a.score > b.score;
                     });
    keep_first(hits, core::errors::get_value(limit));

    return json{{"status", "success"},
                {"query", query},
                {"count", hits.size()},
                {"results", hits}};
}

core::errors::Result<json> ContextTools::predict(const ToolArguments& args) const {
    const std::string description = args.get_string("activity_description");
    auto limit = bounded_limit(args, "max_results");
    if (core::errors::is_error(limit)) {
        return core::errors::get_error(limit);
    }

    auto predictions = engine_.predictor->predict(description, core::errors::get_value(limit));
    const double floor = limits_.min_confidence;
    predictions.erase(std::remove_if(predictions.begin(), predictions.end(),
                                     [floor](const engine::Prediction& p) {
                                         return p.confidence < floor;
                                     }),
                      predictions.end());
    std::stable_sort(predictions.begin(), predictions.end(),
                     [](const engine::Prediction& a, const engine::Prediction& b) {
                         return a.confidence > b.confidence;
                     });
    keep_first(predictions, core::errors::get_value(limit));

    return json{{"status", "success"},
                {"activity_description", description},
                {"min_confidence", floor},
                {"count", predictions.size()},
                {"predictions", predictions}};
}

core::errors::Result<json> ContextTools::suggestions(const ToolArguments& args) const {
    const std::string description = args.get_string("activity_description");
    const auto grouped = engine_.predictor->suggestions(description);
    return json{{"status", "success"},
                {"activity_description", description},
                {"suggestions", grouped}};
}

core::errors::Result<json> ContextTools::related(const ToolArguments& args) const {
    const std::string activity_id = args.get_string("activity_id");
    const std::int64_t requested = args.get_int("max_depth");
    if (requested < 1) {
        return ContinuityError{ErrorKind::InvalidParams,
                               "max_depth must be at least 1, got " + std::to_string(requested),
                               "depth_out_of_range"};
    }
    const std::int64_t depth = std::min(requested, limits_.max_graph_depth);

    if (!engine_.graph->has_activity(activity_id)) {
        return ContinuityError{ErrorKind::NotFound,
                               "Activity " + activity_id + " not found in graph",
                               "activity_not_found"};
    }
    if (args.cancelled()) {
        return cancelled_error("context_related");
    }

    auto related = engine_.graph->related(activity_id, depth);
    related.erase(std::remove_if(related.begin(), related.end(),
                                 [depth](const engine::RelatedActivity& r) {
                                     return r.distance > depth;
                                 }),
                  related.end());
    std::stable_sort(related.begin(), related.end(),
                     [](const engine::RelatedActivity& a, const engine::RelatedActivity& b) {
                         return a.distance < b.distance;
                     });

    return json{{"status", "success"},
                {"activity_id", activity_id},
                {"max_depth", depth},
                {"depth_clamped", depth != requested},
                {"count", related.size()},
                {"related", related}};
}

core::errors::Result<json> ContextTools::stats(const ToolArguments& args) const {
    std::vector<std::pair<std::string, StatsSection>> sections;

    sections.emplace_back("database", collect_section("activity_db", engine_.activities));
    if (args.cancelled()) {
        return cancelled_error("context_stats");
    }
    sections.emplace_back("embeddings", collect_section("embeddings", engine_.embeddings));
    if (args.cancelled()) {
        return cancelled_error("context_stats");
    }
    sections.emplace_back("graph", collect_section("graph", engine_.graph));
    sections.emplace_back("privacy", privacy_ ? StatsSection{privacy_->stats()}
                                              : StatsSection{StoreUnavailable{"not configured"}});

    json stats = json::object();
    json unavailable = json::array();
    for (const auto& [name, section] : sections) {
        if (std::holds_alternative<StoreUnavailable>(section)) {
            unavailable.push_back(name);
        }
        stats[name] = engine::section_to_json(section);
    }
    return json{{"status", "success"}, {"stats", stats}, {"unavailable", unavailable}};
}

core::errors::Result<json> ContextTools::list_contexts(const ToolArguments& args) const {
    auto limit = bounded_limit(args, "limit");
    if (core::errors::is_error(limit)) {
        return core::errors::get_error(limit);
    }

    auto contexts = engine_.activities->list_contexts(core::errors::get_value(limit));
    std::stable_sort(contexts.begin(), contexts.end(),
                     [](const engine::WorkContext& a, const engine::WorkContext& b) {
                         return a.last_active > b.last_active;
                     });
    keep_first(contexts, core::errors::get_value(limit));

    return json{{"status", "success"}, {"count", contexts.size()}, {"contexts", contexts}};
}

core::errors::Result<json> ContextTools::cleanup(const ToolArguments& args) const {
    const std::int64_t days = args.get_int("days");
    if (days < 0) {
        return ContinuityError{ErrorKind::InvalidParams,
                               "days must not be negative, got " + std::to_string(days),
                               "days_out_of_range"};
    }
    if (args.cancelled()) {
        return cancelled_error("context_cleanup");
    }

    const std::size_t deleted = engine_.activities->cleanup_older_than(days);
    LOG_INFO("context_cleanup: removed " + std::to_string(deleted) +
             " activities older than " + std::to_string(days) + " days");
    return json{{"status", "success"},
                {"deleted_records", deleted},
                {"retention_days", days},
                {"message", "Cleaned up data older than " + std::to_string(days) + " days"}};
}

core::errors::Result<json> ContextTools::privacy_blacklist(const ToolArguments& args) const {
    auto kind = policy::parse_blacklist_kind(args.get_string("type"));
    if (core::errors::is_error(kind)) {
        return core::errors::get_error(kind);
    }
    auto action = policy::parse_blacklist_action(args.get_string("action"));
    if (core::errors::is_error(action)) {
        return core::errors::get_error(action);
    }
    const std::string value = args.get_string("value");

    auto edit = privacy_->edit(core::errors::get_value(kind), value,
                               core::errors::get_value(action));
    if (core::errors::is_error(edit)) {
        return core::errors::get_error(edit);
    }

    const auto& result = core::errors::get_value(edit);
    const std::string kind_name = policy::to_string(core::errors::get_value(kind));
    std::string message;
    if (core::errors::get_value(action) == policy::BlacklistAction::Add) {
        message = result.changed ? "Added " + kind_name + " to blacklist: " + value
                                 : kind_name + " already blacklisted: " + value;
    } else {
        message = result.changed ? "Removed " + kind_name + " from blacklist: " + value
                                 : kind_name + " was not blacklisted: " + value;
    }

    return json{{"status", "success"},
                {"action", policy::to_string(core::errors::get_value(action))},
                {"type", kind_name},
                {"value", value},
                {"changed", result.changed},
                {"message", message},
                {"blacklisted_apps", result.snapshot.apps},
                {"blacklisted_directories", result.snapshot.directories}};
}

core::errors::Result<json> ContextTools::create_context(const ToolArguments& args) const {
    engine::ContextUpdate update;
    update.name = args.get_string("name");
    if (args.has("description")) {
        update.description = args.get_string("description");
    }
    if (args.has("tags")) {
        update.tags = args.get_string_list("tags");
    }

    const auto upsert = engine_.activities->upsert_context(update);
    LOG_INFO(std::string("context_create_context: ") + (upsert.created ? "created" : "updated") +
             " '" + update.name + "'");
    return json{{"status", "success"},
                {"created", upsert.created},
                {"context_id", upsert.context.id},
                {"context", upsert.context},
                {"message", std::string(upsert.created ? "Created" : "Updated") + " context '" +
                                update.name + "'"}};
}

core::errors::Result<std::size_t> register_context_tools(ToolRegistry& registry,
                                                         std::shared_ptr<const ContextTools> tools) {
    const std::int64_t ceiling = tools->limits().max_graph_depth;
    auto handler_for = [tools](core::errors::Result<json> (ContextTools::*method)(const ToolArguments&)
                            const) {
        return [tools, method](const ToolArguments& args) { return ((*tools).*method)(args); };
    };

    std::vector<ToolDescriptor> descriptors;

    descriptors.push_back(ToolDescriptor{
        "context_recent_activities",
        "Get recent activities from the context engine",
        {ParamSpec{"hours", ParamType::Integer, false, 24, "Number of hours to look back"},
         ParamSpec{"limit", ParamType::Integer, false, 50,
                   "Maximum number of activities to return"}},
        false, ResultShape::List, "activities", handler_for(&ContextTools::recent_activities)});

    descriptors.push_back(ToolDescriptor{
        "context_search",
        "Search activities using semantic similarity",
        {ParamSpec{"query", ParamType::String, true, nullptr, "Search query", {}, true},
         ParamSpec{"limit", ParamType::Integer, false, 10, "Maximum number of results"}},
        false, ResultShape::List, "results", handler_for(&ContextTools::search)});

    descriptors.push_back(ToolDescriptor{
        "context_predict",
        "Predict next likely activities based on the current activity",
        {ParamSpec{"activity_description", ParamType::String, true, nullptr,
                   "Description of the current activity", {}, true},
         ParamSpec{"max_results", ParamType::Integer, false, 5,
                   "Maximum number of predictions"}},
        false, ResultShape::List, "predictions", handler_for(&ContextTools::predict)});

    descriptors.push_back(ToolDescriptor{
        "context_suggestions",
        "Get context suggestions (files, apps, next actions) for an activity",
        {ParamSpec{"activity_description", ParamType::String, true, nullptr,
                   "Description of the current activity", {}, true}},
        false, ResultShape::Grouped, "", handler_for(&ContextTools::suggestions)});

    descriptors.push_back(ToolDescriptor{
        "context_related",
        "Find activities related to a given activity in the temporal graph",
        {ParamSpec{"activity_id", ParamType::String, true, nullptr, "ID of the activity", {},
                   true},
         ParamSpec{"max_depth", ParamType::Integer, false, 2,
                   "Maximum graph traversal depth (clamped to " + std::to_string(ceiling) +
                       ")"}},
        false, ResultShape::List, "related", handler_for(&ContextTools::related)});

    descriptors.push_back(ToolDescriptor{
        "context_stats",
        "Get statistics about the context engine",
        {},
        false, ResultShape::Aggregate, "", handler_for(&ContextTools::stats)});

    descriptors.push_back(ToolDescriptor{
        "context_list_contexts",
        "List known work contexts, most recently active first",
        {ParamSpec{"limit", ParamType::Integer, false, 20,
                   "Maximum number of contexts to return"}},
        false, ResultShape::List, "contexts", handler_for(&ContextTools::list_contexts)});

    descriptors.push_back(ToolDescriptor{
        "context_cleanup",
        "Remove activity data older than the retention period",
        {ParamSpec{"days", ParamType::Integer, false, 90, "Keep data newer than this many days"}},
        false, ResultShape::Count, "", handler_for(&ContextTools::cleanup)});

    descriptors.push_back(ToolDescriptor{
        "context_privacy_blacklist",
        "Add or remove apps and directories from the privacy blacklist",
        {ParamSpec{"type", ParamType::String, true, nullptr, "What to blacklist",
                   {"app", "directory"}},
         ParamSpec{"value", ParamType::String, true, nullptr,
                   "App name or directory path", {}, true},
         ParamSpec{"action", ParamType::String, true, nullptr, "Add or remove the entry",
                   {"add", "remove"}}},
        true, ResultShape::Record, "", handler_for(&ContextTools::privacy_blacklist)});

    descriptors.push_back(ToolDescriptor{
        "context_create_context",
        "Create a work context, or update it if the name already exists",
        {ParamSpec{"name", ParamType::String, true, nullptr, "Context name", {}, true},
         ParamSpec{"description", ParamType::String, false, nullptr, "Context description"},
         ParamSpec{"tags", ParamType::StringArray, false, nullptr, "Tags for the context"}},
        false, ResultShape::Record, "", handler_for(&ContextTools::create_context)});

    std::size_t registered = 0;
    for (auto& descriptor : descriptors) {
        auto result = registry.register_tool(std::move(descriptor));
        if (core::errors::is_error(result)) {
            return core::errors::get_error(result);
        }
        registered = core::errors::get_value(result);
    }
    return registered;
}

}  // namespace continuity::tools
