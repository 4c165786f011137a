#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "engine/collaborators.hpp"

namespace continuity::engine {

// Activity log backed by the engine's SQLite database. The connection is opened
// in serialized mode so concurrent handler threads may share it.
class SqliteActivityStore : public ActivityStore {
public:
    using Clock = std::function<double()>;

    explicit SqliteActivityStore(const std::filesystem::path& database_path,
                                 Clock clock = nullptr);
    ~SqliteActivityStore() override;

    SqliteActivityStore(const SqliteActivityStore&) = delete;
    SqliteActivityStore& operator=(const SqliteActivityStore&) = delete;

    std::vector<Activity> recent_activities(std::int64_t hours,
                                            std::int64_t limit) const override;
    std::size_t cleanup_older_than(std::int64_t days) override;
    std::vector<WorkContext> list_contexts(std::int64_t limit) const override;
    ContextUpsert upsert_context(const ContextUpdate& update) override;
    nlohmann::json stats() const override;

    // Writes one activity row; the daemon owns capture, this is for imports and tests.
    void insert_activity(const Activity& activity);

    static constexpr const char* kStoreName = "activity_db";

private:
    void ensure_schema();
    double now() const;

    struct Impl;
    std::unique_ptr<Impl> impl_;
    Clock clock_;
};

}  // namespace continuity::engine
