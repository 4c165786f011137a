#include "policy/blacklist_store.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace continuity::policy {

using core::errors::store_failure;
using nlohmann::json;

JsonConfigBlacklistStore::JsonConfigBlacklistStore(std::filesystem::path config_path)
    : config_path_(std::move(config_path)) {}

core::errors::Result<Blacklist> JsonConfigBlacklistStore::save(const Blacklist& blacklist) {
    json root = json::object();
    std::error_code ec;
    if (std::filesystem::exists(config_path_, ec) && !ec) {
        std::ifstream in(config_path_);
        if (!in.is_open()) {
            return store_failure(kStoreName,
                                 "Failed to open configuration: " + config_path_.string());
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        root = json::parse(buffer.str(), nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            return store_failure(kStoreName, "Configuration is not a JSON object: " +
                                                 config_path_.string());
        }
    }

    json& privacy = root["privacy"];
    if (!privacy.is_object()) {
        privacy = json::object();
    }
    privacy["blacklist_apps"] = blacklist.apps;
    privacy["blacklist_directories"] = blacklist.directories;

    // Write-then-rename so a crash never leaves a truncated configuration behind.
    std::filesystem::path temp_path = config_path_;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            return store_failure(kStoreName,
                                 "Failed to open temporary configuration: " + temp_path.string());
        }
        out << root.dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            std::filesystem::remove(temp_path, ec);
            return store_failure(kStoreName,
                                 "Failed to write configuration: " + temp_path.string());
        }
    }

    std::filesystem::rename(temp_path, config_path_, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return store_failure(kStoreName, "Failed to replace configuration " +
                                             config_path_.string() + ": " + ec.message());
    }
    return blacklist;
}

}  // namespace continuity::policy
