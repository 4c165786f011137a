#include "policy/privacy_filter.hpp"

#include <algorithm>
#include <mutex>
#include <utility>
#include "core/logging/logger.hpp"

namespace continuity::policy {

using core::errors::ContinuityError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

constexpr const char* kAppKeys[] = {"app_name", "app"};
constexpr const char* kPathKeys[] = {"file_path", "path", "directory", "cwd",
                                     "working_directory"};
constexpr const char* kNestedKeys[] = {"metadata", "activity"};

std::filesystem::path normalize(const std::filesystem::path& path) {
    std::filesystem::path normal = path.lexically_normal();
    if (!normal.empty() && normal.filename().empty() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

std::optional<std::string> string_member(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Every id a dropped record can be referenced by.
void collect_ids(const json& object, std::set<std::string>& ids) {
    for (const char* key : {"id", "activity_id"}) {
        auto id = string_member(object, key);
        if (id.has_value()) {
            ids.insert(id.value());
        }
    }
    auto nested = object.find("activity");
    if (nested != object.end() && nested->is_object()) {
        collect_ids(*nested, ids);
    }
}

void prune_paths(json& node, const std::set<std::string>& denied_ids) {
    if (node.is_array()) {
        for (auto& item : node) {
            prune_paths(item, denied_ids);
        }
        return;
    }
    if (!node.is_object()) {
        return;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (it.key() == "path" && it->is_array()) {
            auto& hops = *it;
            hops.erase(std::remove_if(hops.begin(), hops.end(),
                                      [&denied_ids](const json& hop) {
                                          return hop.is_string() &&
                                                 denied_ids.count(hop.get<std::string>()) > 0;
                                      }),
                       hops.end());
            continue;
        }
        prune_paths(*it, denied_ids);
    }
}

}  // namespace

core::errors::Result<BlacklistKind> parse_blacklist_kind(const std::string& value) {
    if (value == "app") {
        return BlacklistKind::App;
    }
    if (value == "directory") {
        return BlacklistKind::Directory;
    }
    return ContinuityError{ErrorKind::InvalidParams,
                           "Unknown type: " + value + ". Use 'app' or 'directory'.",
                           "unknown_blacklist_type"};
}

core::errors::Result<BlacklistAction> parse_blacklist_action(const std::string& value) {
    if (value == "add") {
        return BlacklistAction::Add;
    }
    if (value == "remove") {
        return BlacklistAction::Remove;
    }
    return ContinuityError{ErrorKind::InvalidParams,
                           "Unknown action: " + value + ". Use 'add' or 'remove'.",
                           "unknown_blacklist_action"};
}

std::string to_string(const BlacklistKind kind) {
    switch (kind) {
        case BlacklistKind::App:
            return "app";
        case BlacklistKind::Directory:
            return "directory";
        default:
            return "unknown";
    }
}

std::string to_string(const BlacklistAction action) {
    switch (action) {
        case BlacklistAction::Add:
            return "add";
        case BlacklistAction::Remove:
            return "remove";
        default:
            return "unknown";
    }
}

PrivacyFilter::PrivacyFilter(Blacklist initial,
                             std::shared_ptr<BlacklistPersistence> persistence,
                             std::filesystem::path home_directory)
    : blacklist_(std::move(initial)),
      persistence_(std::move(persistence)),
      home_directory_(std::move(home_directory)) {}

bool PrivacyFilter::is_within(const std::filesystem::path& root,
                              const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::filesystem::path PrivacyFilter::expand(const std::string& directory) const {
    if (!home_directory_.empty() && !directory.empty() && directory[0] == '~' &&
        (directory.size() == 1 || directory[1] == '/')) {
        return normalize(home_directory_ / directory.substr(directory.size() == 1 ? 1 : 2));
    }
    return normalize(directory);
}

bool PrivacyFilter::allows(const PrivacyRecord& record) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return allows_locked(record);
}

bool PrivacyFilter::allows_locked(const PrivacyRecord& record) const {
    if (record.app.has_value() && blacklist_.apps.count(record.app.value()) > 0) {
        return false;
    }
    if (record.path.has_value() && !record.path->empty()) {
        const std::filesystem::path candidate = normalize(record.path.value());
        for (const auto& directory : blacklist_.directories) {
            if (directory.empty()) {
                continue;
            }
            if (is_within(expand(directory), candidate)) {
                return false;
            }
        }
    }
    return true;
}

bool PrivacyFilter::denies_object_locked(const json& object) const {
    for (const char* key : kAppKeys) {
        auto app = string_member(object, key);
        if (app.has_value() && !allows_locked(PrivacyRecord{app, std::nullopt})) {
            return true;
        }
    }
    for (const char* key : kPathKeys) {
        auto path = string_member(object, key);
        if (path.has_value() && !allows_locked(PrivacyRecord{std::nullopt, path})) {
            return true;
        }
    }
    for (const char* key : kNestedKeys) {
        auto it = object.find(key);
        if (it != object.end() && it->is_object() && denies_object_locked(*it)) {
            return true;
        }
    }
    return false;
}

std::size_t PrivacyFilter::redact_locked(json& node, std::set<std::string>& denied_ids) const {
    std::size_t removed = 0;
    if (node.is_array()) {
        for (auto it = node.begin(); it != node.end();) {
            if (it->is_object() && denies_object_locked(*it)) {
                collect_ids(*it, denied_ids);
                it = node.erase(it);
                ++removed;
                continue;
            }
            removed += redact_locked(*it, denied_ids);
            ++it;
        }
        return removed;
    }

    if (!node.is_object()) {
        return 0;
    }
    for (auto& [key, value] : node.items()) {
        const bool app_list = key == "apps";
        const bool path_list = key == "files";
        if ((app_list || path_list) && value.is_array()) {
            for (auto it = value.begin(); it != value.end();) {
                if (it->is_string()) {
                    const std::string entry = it->get<std::string>();
                    const PrivacyRecord record =
                        app_list ? PrivacyRecord{entry, std::nullopt}
                                 : PrivacyRecord{std::nullopt, entry};
                    if (!allows_locked(record)) {
                        it = value.erase(it);
                        ++removed;
                        continue;
                    }
                }
                ++it;
            }
            continue;
        }
        removed += redact_locked(value, denied_ids);
    }
    return removed;
}

std::size_t PrivacyFilter::redact(json& payload) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::set<std::string> denied_ids;
    const std::size_t removed = redact_locked(payload, denied_ids);
    if (!denied_ids.empty()) {
        prune_paths(payload, denied_ids);
    }
    records_redacted_.fetch_add(removed);
    return removed;
}

core::errors::Result<BlacklistEdit> PrivacyFilter::edit(const BlacklistKind kind,
                                                        const std::string& value,
                                                        const BlacklistAction action) {
    if (value.empty()) {
        return ContinuityError{ErrorKind::InvalidParams, "Blacklist value cannot be empty.",
                               "empty_blacklist_value"};
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    Blacklist next = blacklist_;
    auto& entries = kind == BlacklistKind::App ? next.apps : next.directories;
    const bool changed =
        action == BlacklistAction::Add ? entries.insert(value).second : entries.erase(value) > 0;
    if (!changed) {
        return BlacklistEdit{blacklist_, false};
    }

    if (persistence_) {
        auto saved = persistence_->save(next);
        if (core::errors::is_error(saved)) {
            // The in-memory snapshot stays at its last durable state.
            LOG_WARN("PrivacyFilter: " + to_string(action) + " " + to_string(kind) +
                     " rolled back: " + core::errors::get_error(saved).message);
            return core::errors::get_error(saved);
        }
    }

    blacklist_ = std::move(next);
    LOG_INFO("PrivacyFilter: " + to_string(action) + " " + to_string(kind) + " entry '" +
             value + "'");
    return BlacklistEdit{blacklist_, true};
}

Blacklist PrivacyFilter::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return blacklist_;
}

json PrivacyFilter::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return json{{"blacklisted_apps", blacklist_.apps.size()},
                {"blacklisted_directories", blacklist_.directories.size()},
                {"records_redacted", records_redacted_.load()}};
}

}  // namespace continuity::policy
