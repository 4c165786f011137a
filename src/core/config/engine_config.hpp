#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/continuity_errors.hpp"

namespace continuity::core::config {

struct StorageConfig {
    std::filesystem::path database_path = "data/context.db";
};

struct VectorDbConfig {
    std::string collection_name = "activities";
    std::string model = "all-MiniLM-L6-v2";
};

struct GraphConfig {
    std::int64_t max_nodes = 10000;
    double decay_factor = 0.95;
    std::int64_t max_depth = 5;
};

struct PredictionConfig {
    std::int64_t prediction_window = 3600;
    double min_confidence = 0.3;
};

struct PrivacyConfig {
    std::vector<std::string> blacklist_apps;
    std::vector<std::string> blacklist_directories;
};

struct EngineDaemonConfig {
    std::filesystem::path socket_path = "data/engine.sock";
    std::uint32_t connect_timeout_ms = 2000;
    std::uint32_t response_timeout_ms = 10000;
};

struct ServerConfig {
    std::uint32_t handler_timeout_ms = 30000;
    std::uint32_t worker_threads = 4;
};

// The engine's static configuration, read once at startup.
struct EngineConfig {
    std::filesystem::path engine_dir;
    std::filesystem::path source_path;
    StorageConfig storage;
    VectorDbConfig vector_db;
    GraphConfig graph;
    PredictionConfig prediction;
    PrivacyConfig privacy;
    EngineDaemonConfig engine;
    ServerConfig server;
};

// Relative paths inside the file are resolved against engine_dir.
core::errors::Result<EngineConfig> load_engine_config(
    const std::filesystem::path& config_path,
    const std::filesystem::path& engine_dir);

core::errors::Result<EngineConfig> parse_engine_config(
    const std::string& text, const std::filesystem::path& engine_dir);

}  // namespace continuity::core::config
