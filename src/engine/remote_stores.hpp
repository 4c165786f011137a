#pragma once

#include <memory>
#include <string>
#include <vector>
#include "engine/collaborators.hpp"
#include "engine/daemon_client.hpp"

namespace continuity::engine {

class RemoteEmbeddingIndex : public EmbeddingIndex {
public:
    RemoteEmbeddingIndex(std::shared_ptr<const DaemonClient> client,
                         std::string collection_name);

    std::vector<SearchHit> search(const std::string& query,
                                  std::int64_t limit) const override;
    nlohmann::json stats() const override;

    static constexpr const char* kStoreName = "embeddings";

private:
    std::shared_ptr<const DaemonClient> client_;
    std::string collection_name_;
};

class RemoteTemporalGraph : public TemporalGraph {
public:
    explicit RemoteTemporalGraph(std::shared_ptr<const DaemonClient> client);

    bool has_activity(const std::string& activity_id) const override;
    std::vector<RelatedActivity> related(const std::string& activity_id,
                                         std::int64_t max_depth) const override;
    nlohmann::json stats() const override;

    static constexpr const char* kStoreName = "graph";

private:
    std::shared_ptr<const DaemonClient> client_;
};

class RemoteContextPredictor : public ContextPredictor {
public:
    RemoteContextPredictor(std::shared_ptr<const DaemonClient> client,
                           std::int64_t prediction_window);

    std::vector<Prediction> predict(const std::string& activity_description,
                                    std::int64_t max_results) const override;
    ContextSuggestions suggestions(const std::string& activity_description) const override;

    static constexpr const char* kStoreName = "predictor";

private:
    std::shared_ptr<const DaemonClient> client_;
    std::int64_t prediction_window_;
};

}  // namespace continuity::engine
