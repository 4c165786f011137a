#include "engine/sqlite_activity_store.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <sqlite3.h>

namespace continuity::engine {

using nlohmann::json;

namespace {

constexpr double kSecondsPerHour = 3600.0;
constexpr double kSecondsPerDay = 86400.0;

// Finalizes the statement on every exit path.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            const std::string message = sqlite3_errmsg(db);
            sqlite3_finalize(st_);
            st_ = nullptr;
            throw StoreError(SqliteActivityStore::kStoreName,
                             "sqlite prepare failed: " + message);
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }

    // SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
    bool step() {
        const int rc = sqlite3_step(st_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw StoreError(SqliteActivityStore::kStoreName,
                         std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
    }

private:
    sqlite3* db_;
    sqlite3_stmt* st_ = nullptr;
};

std::string column_text(sqlite3_stmt* st, const int col) {
    const unsigned char* text = sqlite3_column_text(st, col);
    return text == nullptr ? std::string() : reinterpret_cast<const char*>(text);
}

json parse_json_column(const std::string& text, const json& fallback) {
    if (text.empty()) {
        return fallback;
    }
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || parsed.type() != fallback.type()) {
        return fallback;
    }
    return parsed;
}

std::vector<std::string> parse_tags(const std::string& text) {
    std::vector<std::string> tags;
    const json parsed = parse_json_column(text, json::array());
    for (const auto& tag : parsed) {
        if (tag.is_string()) {
            tags.push_back(tag.get<std::string>());
        }
    }
    return tags;
}

WorkContext read_context(sqlite3_stmt* st) {
    WorkContext context;
    context.id = sqlite3_column_int64(st, 0);
    context.name = column_text(st, 1);
    context.description = column_text(st, 2);
    context.tags = parse_tags(column_text(st, 3));
    context.created_at = sqlite3_column_double(st, 4);
    context.last_active = sqlite3_column_double(st, 5);
    return context;
}

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string e = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError(SqliteActivityStore::kStoreName, "sqlite exec: " + e);
    }
}

std::int64_t count_rows(sqlite3* db, const char* sql) {
    Statement st(db, sql);
    return st.step() ? sqlite3_column_int64(st.get(), 0) : 0;
}

}  // namespace

struct SqliteActivityStore::Impl {
    sqlite3* db = nullptr;
    std::string path;
    std::mutex write_mutex;  // read-modify-write sequences on the shared connection
};

SqliteActivityStore::SqliteActivityStore(const std::filesystem::path& database_path,
                                         Clock clock)
    : impl_(std::make_unique<Impl>()), clock_(std::move(clock)) {
    impl_->path = database_path.string();
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(impl_->path.c_str(), &impl_->db, flags, nullptr) != SQLITE_OK) {
        const std::string message =
            impl_->db != nullptr ? sqlite3_errmsg(impl_->db) : "out of memory";
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        throw StoreError(kStoreName, "sqlite open failed for " + impl_->path + ": " + message);
    }
    sqlite3_busy_timeout(impl_->db, 5000);
    ensure_schema();
}

SqliteActivityStore::~SqliteActivityStore() {
    if (impl_ && impl_->db) {
        sqlite3_close(impl_->db);
    }
}

void SqliteActivityStore::ensure_schema() {
    exec(impl_->db,
         "CREATE TABLE IF NOT EXISTS activities ("
         " id TEXT PRIMARY KEY,"
         " timestamp REAL NOT NULL,"
         " activity_type TEXT,"
         " app_name TEXT,"
         " window_title TEXT,"
         " file_path TEXT,"
         " metadata TEXT"
         ");"
         "CREATE INDEX IF NOT EXISTS idx_activities_timestamp ON activities(timestamp);"
         "CREATE TABLE IF NOT EXISTS contexts ("
         " id INTEGER PRIMARY KEY AUTOINCREMENT,"
         " name TEXT NOT NULL UNIQUE,"
         " description TEXT,"
         " tags TEXT,"
         " created_at REAL NOT NULL,"
         " last_active REAL NOT NULL"
         ");");
}

double SqliteActivityStore::now() const {
    if (clock_) {
        return clock_();
    }
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

std::vector<Activity> SqliteActivityStore::recent_activities(const std::int64_t hours,
                                                             const std::int64_t limit) const {
    std::vector<Activity> activities;
    if (hours <= 0 || limit <= 0) {
        return activities;
    }

    Statement st(impl_->db,
                 "SELECT id, timestamp, activity_type, app_name, window_title, file_path, "
                 "metadata FROM activities WHERE timestamp >= ? "
                 "ORDER BY timestamp DESC LIMIT ?");
    sqlite3_bind_double(st.get(), 1, now() - static_cast<double>(hours) * kSecondsPerHour);
    sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(limit));

    while (st.step()) {
        Activity activity;
        activity.id = column_text(st.get(), 0);
        activity.timestamp = sqlite3_column_double(st.get(), 1);
        activity.activity_type = column_text(st.get(), 2);
        activity.app_name = column_text(st.get(), 3);
        activity.window_title = column_text(st.get(), 4);
        activity.file_path = column_text(st.get(), 5);
        activity.metadata = parse_json_column(column_text(st.get(), 6), json::object());
        activities.push_back(std::move(activity));
    }
    return activities;
}

std::size_t SqliteActivityStore::cleanup_older_than(const std::int64_t days) {
    std::lock_guard<std::mutex> lock(impl_->write_mutex);
    Statement st(impl_->db, "DELETE FROM activities WHERE timestamp < ?");
    sqlite3_bind_double(st.get(), 1, now() - static_cast<double>(days) * kSecondsPerDay);
    st.step();
    return static_cast<std::size_t>(sqlite3_changes(impl_->db));
}

std::vector<WorkContext> SqliteActivityStore::list_contexts(const std::int64_t limit) const {
    std::vector<WorkContext> contexts;
    if (limit <= 0) {
        return contexts;
    }

    Statement st(impl_->db,
                 "SELECT id, name, description, tags, created_at, last_active "
                 "FROM contexts ORDER BY last_active DESC LIMIT ?");
    sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(limit));
    while (st.step()) {
        contexts.push_back(read_context(st.get()));
    }
    return contexts;
}

ContextUpsert SqliteActivityStore::upsert_context(const ContextUpdate& update) {
    std::lock_guard<std::mutex> lock(impl_->write_mutex);
    const double timestamp = now();

    ContextUpsert result;
    {
        Statement select(impl_->db,
                         "SELECT id, name, description, tags, created_at, last_active "
                         "FROM contexts WHERE name = ?");
        sqlite3_bind_text(select.get(), 1, update.name.c_str(), -1, SQLITE_TRANSIENT);
        if (select.step()) {
            result.context = read_context(select.get());
        } else {
            result.created = true;
        }
    }

    WorkContext& context = result.context;
    if (result.created) {
        context.name = update.name;
        context.description = update.description.value_or("");
        context.tags = update.tags.value_or(std::vector<std::string>{});
        context.created_at = timestamp;
        context.last_active = timestamp;

        Statement insert(impl_->db,
                         "INSERT INTO contexts (name, description, tags, created_at, last_active) "
                         "VALUES (?, ?, ?, ?, ?)");
        const std::string tags = json(context.tags).dump();
        sqlite3_bind_text(insert.get(), 1, context.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(insert.get(), 2, context.description.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(insert.get(), 3, tags.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(insert.get(), 4, context.created_at);
        sqlite3_bind_double(insert.get(), 5, context.last_active);
        insert.step();
        context.id = sqlite3_last_insert_rowid(impl_->db);
        return result;
    }

    // Merge: description replaced only when given, tags unioned in first-seen order.
    if (update.description.has_value()) {
        context.description = update.description.value();
    }
    if (update.tags.has_value()) {
        for (const auto& tag : update.tags.value()) {
            if (std::find(context.tags.begin(), context.tags.end(), tag) == context.tags.end()) {
                context.tags.push_back(tag);
            }
        }
    }
    context.last_active = timestamp;

    Statement upd(impl_->db,
                  "UPDATE contexts SET description = ?, tags = ?, last_active = ? WHERE id = ?");
    const std::string tags = json(context.tags).dump();
    sqlite3_bind_text(upd.get(), 1, context.description.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(upd.get(), 2, tags.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(upd.get(), 3, context.last_active);
    sqlite3_bind_int64(upd.get(), 4, static_cast<sqlite3_int64>(context.id));
    upd.step();
    return result;
}

json SqliteActivityStore::stats() const {
    json stats;
    stats["total_activities"] = count_rows(impl_->db, "SELECT COUNT(*) FROM activities");
    stats["total_contexts"] = count_rows(impl_->db, "SELECT COUNT(*) FROM contexts");

    Statement range(impl_->db, "SELECT MIN(timestamp), MAX(timestamp) FROM activities");
    if (range.step() && sqlite3_column_type(range.get(), 0) != SQLITE_NULL) {
        stats["oldest_activity"] = sqlite3_column_double(range.get(), 0);
        stats["newest_activity"] = sqlite3_column_double(range.get(), 1);
    } else {
        stats["oldest_activity"] = nullptr;
        stats["newest_activity"] = nullptr;
    }
    stats["database_path"] = impl_->path;
    return stats;
}

void SqliteActivityStore::insert_activity(const Activity& activity) {
    std::lock_guard<std::mutex> lock(impl_->write_mutex);
    Statement st(impl_->db,
                 "INSERT OR REPLACE INTO activities "
                 "(id, timestamp, activity_type, app_name, window_title, file_path, metadata) "
                 "VALUES (?, ?, ?, ?, ?, ?, ?)");
    const std::string metadata = activity.metadata.dump();
    sqlite3_bind_text(st.get(), 1, activity.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(st.get(), 2, activity.timestamp);
    sqlite3_bind_text(st.get(), 3, activity.activity_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.get(), 4, activity.app_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.get(), 5, activity.window_title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.get(), 6, activity.file_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.get(), 7, metadata.c_str(), -1, SQLITE_TRANSIENT);
    st.step();
}

}  // namespace continuity::engine
