#include "core/config/engine_config.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace continuity::core::config {

using core::errors::ContinuityError;
using core::errors::ErrorKind;
using nlohmann::json;

namespace {

constexpr std::int64_t kMaxTimeoutMs = 600000;
constexpr std::int64_t kMaxWorkerThreads = 64;

template <typename T>
void read_optional(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    target = it->get<T>();
}

// Reads a signed value first so negative numbers are rejected instead of wrapping.
std::optional<ContinuityError> read_bounded(const json& section, const char* section_name,
                                            const char* key, const std::int64_t min,
                                            const std::int64_t max, std::uint32_t& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return std::nullopt;
    }
    const auto value = it->get<std::int64_t>();
    if (value < min || value > max) {
        return ContinuityError{ErrorKind::Config,
                               std::string(section_name) + "." + key + " must be within [" +
                                   std::to_string(min) + ", " + std::to_string(max) + "].",
                               "config_out_of_range"};
    }
    target = static_cast<std::uint32_t>(value);
    return std::nullopt;
}

void read_optional_path(const json& section, const char* key,
                        std::filesystem::path& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    target = std::filesystem::path(it->get<std::string>());
}

const json& section_or_empty(const json& root, const char* name) {
    static const json kEmpty = json::object();
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) {
        return kEmpty;
    }
    return *it;
}

std::filesystem::path resolve(const std::filesystem::path& engine_dir,
                              const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute()) {
        return path;
    }
    return (engine_dir / path).lexically_normal();
}

}  // namespace

core::errors::Result<EngineConfig> parse_engine_config(
    const std::string& text, const std::filesystem::path& engine_dir) {
    const json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return ContinuityError{ErrorKind::Config,
                               "Engine configuration is not valid JSON.",
                               "config_parse_failed"};
    }
    if (!root.is_object()) {
        return ContinuityError{ErrorKind::Config,
                               "Engine configuration must be a JSON object.",
                               "config_parse_failed"};
    }

    EngineConfig config;
    config.engine_dir = engine_dir;
    try {
        read_optional_path(section_or_empty(root, "storage"), "database_path",
                           config.storage.database_path);

        const json& vector_db = section_or_empty(root, "vector_db");
        read_optional(vector_db, "collection_name", config.vector_db.collection_name);
        read_optional(vector_db, "model", config.vector_db.model);

        const json& graph = section_or_empty(root, "graph");
        read_optional(graph, "max_nodes", config.graph.max_nodes);
        read_optional(graph, "decay_factor", config.graph.decay_factor);
        read_optional(graph, "max_depth", config.graph.max_depth);

        const json& prediction = section_or_empty(root, "prediction");
        read_optional(prediction, "prediction_window",
                      config.prediction.prediction_window);
        read_optional(prediction, "min_confidence", config.prediction.min_confidence);

        const json& privacy = section_or_empty(root, "privacy");
        read_optional(privacy, "blacklist_apps", config.privacy.blacklist_apps);
        read_optional(privacy, "blacklist_directories",
                      config.privacy.blacklist_directories);

        const json& engine = section_or_empty(root, "engine");
        read_optional_path(engine, "socket_path", config.engine.socket_path);
        const json& server = section_or_empty(root, "server");
        const std::optional<ContinuityError> range_errors[] = {
            read_bounded(engine, "engine", "connect_timeout_ms", 1, kMaxTimeoutMs,
                         config.engine.connect_timeout_ms),
            read_bounded(engine, "engine", "response_timeout_ms", 1, kMaxTimeoutMs,
                         config.engine.response_timeout_ms),
            read_bounded(server, "server", "handler_timeout_ms", 1, kMaxTimeoutMs,
                         config.server.handler_timeout_ms),
            read_bounded(server, "server", "worker_threads", 0, kMaxWorkerThreads,
                         config.server.worker_threads)};
        for (const auto& error : range_errors) {
            if (error.has_value()) {
                return error.value();
            }
        }
    } catch (const json::exception& e) {
        return ContinuityError{ErrorKind::Config,
                               std::string("Engine configuration has a mistyped field: ") +
                                   e.what(),
                               "config_type_mismatch"};
    }

    if (config.graph.max_depth < 1) {
        return ContinuityError{ErrorKind::Config, "graph.max_depth must be at least 1.",
                               "config_out_of_range"};
    }
    if (config.prediction.min_confidence < 0.0 || config.prediction.min_confidence > 1.0) {
        return ContinuityError{ErrorKind::Config,
                               "prediction.min_confidence must be within [0, 1].",
                               "config_out_of_range"};
    }

    config.storage.database_path = resolve(engine_dir, config.storage.database_path);
    config.engine.socket_path = resolve(engine_dir, config.engine.socket_path);
    return config;
}

core::errors::Result<EngineConfig> load_engine_config(
    const std::filesystem::path& config_path,
    const std::filesystem::path& engine_dir) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec) || ec) {
        return ContinuityError{ErrorKind::Config,
                               "Engine configuration not found: " + config_path.string(),
                               "config_missing",
                               "Pass --config or --engine-dir pointing at the engine checkout."};
    }

    std::ifstream in(config_path);
    if (!in.is_open()) {
        return ContinuityError{ErrorKind::Config,
                               "Failed to open engine configuration: " + config_path.string(),
                               "config_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse_engine_config(buffer.str(), engine_dir);
    if (core::errors::is_error(parsed)) {
        auto err = core::errors::get_error(parsed);
        err.message += " (" + config_path.string() + ")";
        return err;
    }
    auto config = core::errors::get_value(parsed);
    config.source_path = config_path;
    return config;
}

}  // namespace continuity::core::config
