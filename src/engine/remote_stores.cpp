#include "engine/remote_stores.hpp"

#include <utility>

namespace continuity::engine {

using nlohmann::json;

namespace {

// Daemon faults surface as StoreError attributed to the store being queried.
json call_or_throw(const DaemonClient& client, const char* store, const std::string& method,
                   const json& params) {
    auto result = client.call(method, params);
    if (core::errors::is_error(result)) {
        throw StoreError(store, core::errors::get_error(result).message);
    }
    return core::errors::get_value(result);
}

template <typename Record>
std::vector<Record> parse_list(const json& payload, const char* store, const char* key) {
    const json* list = &payload;
    if (payload.is_object()) {
        auto it = payload.find(key);
        if (it == payload.end()) {
            throw StoreError(store, std::string("engine response is missing '") + key + "'");
        }
        list = &*it;
    }
    if (!list->is_array()) {
        throw StoreError(store, std::string("engine response field '") + key +
                                    "' is not a list");
    }

    std::vector<Record> records;
    records.reserve(list->size());
    for (const auto& item : *list) {
        if (!item.is_object()) {
            continue;
        }
        try {
            records.push_back(item.get<Record>());
        } catch (const json::exception& e) {
            throw StoreError(store, std::string("malformed '") + key + "' record: " + e.what());
        }
    }
    return records;
}

}  // namespace

RemoteEmbeddingIndex::RemoteEmbeddingIndex(std::shared_ptr<const DaemonClient> client,
                                           std::string collection_name)
    : client_(std::move(client)), collection_name_(std::move(collection_name)) {}

std::vector<SearchHit> RemoteEmbeddingIndex::search(const std::string& query,
                                                    const std::int64_t limit) const {
    const json payload = call_or_throw(
        *client_, kStoreName, "embeddings.search",
        {{"collection", collection_name_}, {"query_text", query}, {"n_results", limit}});
    return parse_list<SearchHit>(payload, kStoreName, "results");
}

json RemoteEmbeddingIndex::stats() const {
    return call_or_throw(*client_, kStoreName, "embeddings.stats",
                         {{"collection", collection_name_}});
}

RemoteTemporalGraph::RemoteTemporalGraph(std::shared_ptr<const DaemonClient> client)
    : client_(std::move(client)) {}

bool RemoteTemporalGraph::has_activity(const std::string& activity_id) const {
    const json payload = call_or_throw(*client_, kStoreName, "graph.has_activity",
                                       {{"activity_id", activity_id}});
    if (payload.is_boolean()) {
        return payload.get<bool>();
    }
    if (payload.is_object() && payload.contains("exists") && payload["exists"].is_boolean()) {
        return payload["exists"].get<bool>();
    }
    throw StoreError(kStoreName, "engine response for graph.has_activity is not a boolean");
}

std::vector<RelatedActivity> RemoteTemporalGraph::related(const std::string& activity_id,
                                                          const std::int64_t max_depth) const {
    const json payload = call_or_throw(*client_, kStoreName, "graph.related",
                                       {{"activity_id", activity_id}, {"max_depth", max_depth}});
    return parse_list<RelatedActivity>(payload, kStoreName, "related");
}

json RemoteTemporalGraph::stats() const {
    return call_or_throw(*client_, kStoreName, "graph.stats", json::object());
}

RemoteContextPredictor::RemoteContextPredictor(std::shared_ptr<const DaemonClient> client,
                                               const std::int64_t prediction_window)
    : client_(std::move(client)), prediction_window_(prediction_window) {}

std::vector<Prediction> RemoteContextPredictor::predict(
    const std::string& activity_description, const std::int64_t max_results) const {
    const json payload =
        call_or_throw(*client_, kStoreName, "predictor.predict",
                      {{"activity", {{"window_title", activity_description}}},
                       {"max_results", max_results},
                       {"prediction_window", prediction_window_}});
    return parse_list<Prediction>(payload, kStoreName, "predictions");
}

ContextSuggestions RemoteContextPredictor::suggestions(
    const std::string& activity_description) const {
    const json payload =
        call_or_throw(*client_, kStoreName, "predictor.suggestions",
                      {{"activity", {{"window_title", activity_description}}},
                       {"prediction_window", prediction_window_}});
    if (!payload.is_object()) {
        throw StoreError(kStoreName, "engine response for predictor.suggestions is not an object");
    }
    return payload.get<ContextSuggestions>();
}

}  // namespace continuity::engine
