#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/continuity_errors.hpp"
#include "policy/blacklist_store.hpp"

namespace continuity::policy {

enum class BlacklistKind {
    App,
    Directory
};

enum class BlacklistAction {
    Add,
    Remove
};

core::errors::Result<BlacklistKind> parse_blacklist_kind(const std::string& value);
core::errors::Result<BlacklistAction> parse_blacklist_action(const std::string& value);
std::string to_string(BlacklistKind kind);
std::string to_string(BlacklistAction action);

// The privacy-relevant facets of one result record.
struct PrivacyRecord {
    std::optional<std::string> app;
    std::optional<std::string> path;
};

struct BlacklistEdit {
    Blacklist snapshot;
    bool changed = false;
};

// Gate applied to every record before it leaves the process. Reads take a
// shared lock; edits are serialized and only become visible once persisted.
class PrivacyFilter {
public:
    explicit PrivacyFilter(Blacklist initial,
                           std::shared_ptr<BlacklistPersistence> persistence = nullptr,
                           std::filesystem::path home_directory = {});

    bool allows(const PrivacyRecord& record) const;

    // Removes denied records from every list inside the payload; returns how many.
    // Ids of removed records are also pruned from any surviving "path" list.
    std::size_t redact(nlohmann::json& payload) const;

    core::errors::Result<BlacklistEdit> edit(BlacklistKind kind, const std::string& value,
                                             BlacklistAction action);

    Blacklist snapshot() const;
    nlohmann::json stats() const;

private:
    bool allows_locked(const PrivacyRecord& record) const;
    bool denies_object_locked(const nlohmann::json& object) const;
    std::size_t redact_locked(nlohmann::json& node, std::set<std::string>& denied_ids) const;
    std::filesystem::path expand(const std::string& directory) const;
    static bool is_within(const std::filesystem::path& root,
                          const std::filesystem::path& child);

    mutable std::shared_mutex mutex_;
    Blacklist blacklist_;
    std::shared_ptr<BlacklistPersistence> persistence_;
    std::filesystem::path home_directory_;
    mutable std::atomic<std::size_t> records_redacted_{0};
};

}  // namespace continuity::policy
