#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/continuity_errors.hpp"

namespace continuity::engine {

struct DaemonClientOptions {
    std::filesystem::path socket_path;
    std::uint32_t connect_timeout_ms = 2000;
    std::uint32_t response_timeout_ms = 10000;
};

// Line-delimited JSON client for the context engine daemon's Unix socket.
// Every call opens its own connection, so one client is shared by all handler
// threads without locking.
class DaemonClient {
public:
    explicit DaemonClient(DaemonClientOptions options);

    core::errors::Result<nlohmann::json> call(const std::string& method,
                                              const nlohmann::json& params) const;

    core::errors::Result<bool> ping() const;

    static constexpr std::size_t kMaxResponseBytes = 16 * 1024 * 1024;

private:
    DaemonClientOptions options_;
    mutable std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace continuity::engine
