#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/records.hpp"

namespace continuity::engine {

// Raised by a collaborator when its backing store fails. Carries the store name
// so the dispatcher can attribute the failure.
class StoreError : public std::runtime_error {
public:
    StoreError(std::string store, const std::string& message)
        : std::runtime_error(message), store_(std::move(store)) {}

    const std::string& store() const { return store_; }

private:
    std::string store_;
};

struct ContextUpdate {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> tags;
};

struct ContextUpsert {
    WorkContext context;
    bool created = false;
};

class ActivityStore {
public:
    virtual ~ActivityStore() = default;

    // Most recent first. hours <= 0 yields nothing.
    virtual std::vector<Activity> recent_activities(std::int64_t hours,
                                                    std::int64_t limit) const = 0;
    // Deletes activities strictly older than now - days; returns the count removed.
    virtual std::size_t cleanup_older_than(std::int64_t days) = 0;
    virtual std::vector<WorkContext> list_contexts(std::int64_t limit) const = 0;
    virtual ContextUpsert upsert_context(const ContextUpdate& update) = 0;
    virtual nlohmann::json stats() const = 0;
};

class EmbeddingIndex {
public:
    virtual ~EmbeddingIndex() = default;

    virtual std::vector<SearchHit> search(const std::string& query,
                                          std::int64_t limit) const = 0;
    virtual nlohmann::json stats() const = 0;
};

class TemporalGraph {
public:
    virtual ~TemporalGraph() = default;

    virtual bool has_activity(const std::string& activity_id) const = 0;
    virtual std::vector<RelatedActivity> related(const std::string& activity_id,
                                                 std::int64_t max_depth) const = 0;
    virtual nlohmann::json stats() const = 0;
};

class ContextPredictor {
public:
    virtual ~ContextPredictor() = default;

    virtual std::vector<Prediction> predict(const std::string& activity_description,
                                            std::int64_t max_results) const = 0;
    virtual ContextSuggestions suggestions(
        const std::string& activity_description) const = 0;
};

// Long-lived handles to the four stores, owned by main and injected into the tools.
struct EngineHandles {
    std::shared_ptr<ActivityStore> activities;
    std::shared_ptr<EmbeddingIndex> embeddings;
    std::shared_ptr<TemporalGraph> graph;
    std::shared_ptr<ContextPredictor> predictor;
};

}  // namespace continuity::engine
