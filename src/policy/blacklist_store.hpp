#pragma once

#include <filesystem>
#include <set>
#include <string>
#include "core/errors/continuity_errors.hpp"

namespace continuity::policy {

struct Blacklist {
    std::set<std::string> apps;
    std::set<std::string> directories;

    bool operator==(const Blacklist& other) const {
        return apps == other.apps && directories == other.directories;
    }
};

// Durable home of the blacklist. save() must either persist the whole snapshot
// or report failure without side effects visible to readers of the source.
class BlacklistPersistence {
public:
    virtual ~BlacklistPersistence() = default;
    virtual core::errors::Result<Blacklist> save(const Blacklist& blacklist) = 0;
};

// Writes the blacklist into the "privacy" section of the engine's JSON
// configuration, leaving every other section untouched.
class JsonConfigBlacklistStore : public BlacklistPersistence {
public:
    explicit JsonConfigBlacklistStore(std::filesystem::path config_path);

    core::errors::Result<Blacklist> save(const Blacklist& blacklist) override;

    static constexpr const char* kStoreName = "config";

private:
    std::filesystem::path config_path_;
};

}  // namespace continuity::policy
