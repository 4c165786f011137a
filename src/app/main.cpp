#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <signal.h>
#include "app/cli_parser.hpp"
#include "core/config/engine_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/continuity_errors.hpp"
#include "core/logging/logger.hpp"
#include "engine/daemon_client.hpp"
#include "engine/remote_stores.hpp"
#include "engine/sqlite_activity_store.hpp"
#include "policy/blacklist_store.hpp"
#include "policy/privacy_filter.hpp"
#include "runtime/dispatcher.hpp"
#include "runtime/worker_pool.hpp"
#include "session/response_writer.hpp"
#include "session/transport_loop.hpp"
#include "tools/context_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

constexpr int kExitCli = 2;
constexpr int kExitConfig = 3;
constexpr int kExitStores = 4;

continuity::session::TransportLoop* g_loop = nullptr;

extern "C" void handle_termination(int) {
    if (g_loop != nullptr) {
        g_loop->request_shutdown();
    }
}

// No SA_RESTART: the blocking read on stdin fails with EINTR and the loop exits.
void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = handle_termination;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

void report(const std::string& what, const continuity::core::errors::ContinuityError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace continuity;

    // 1. Tag every diagnostic line with this server session
    core::logging::Logger::get().set_session_id(core::config::generate_session_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = app::cli::parse_and_validate(argc, argv);
    if (core::errors::is_error(parsed)) {
        report("Input error", core::errors::get_error(parsed));
        return kExitCli;
    }
    const auto& options = core::errors::get_value(parsed);
    if (options.show_help) {
        std::cout << app::cli::usage() << std::endl;
        return 0;
    }
    if (options.verbose) {
        core::logging::Logger::get().set_min_level(core::logging::LogLevel::DEBUG);
    }
    LOG_INFO("Context continuity server: bootstrapping from " + options.engine_dir.string());

    // 3. Engine configuration, read once
    auto loaded = core::config::load_engine_config(options.config_path, options.engine_dir);
    if (core::errors::is_error(loaded)) {
        report("Configuration error", core::errors::get_error(loaded));
        return kExitConfig;
    }
    core::config::EngineConfig config = core::errors::get_value(loaded);
    if (options.socket_path) {
        config.engine.socket_path = options.socket_path.value();
    }
    if (options.timeout_ms) {
        config.server.handler_timeout_ms = options.timeout_ms.value();
    }

    // 4. External stores
    engine::EngineHandles handles;
    try {
        handles.activities =
            std::make_shared<engine::SqliteActivityStore>(config.storage.database_path);
    } catch (const engine::StoreError& e) {
        LOG_ERROR("Activity database unavailable: " + std::string(e.what()));
        return kExitStores;
    }

    engine::DaemonClientOptions daemon_options;
    daemon_options.socket_path = config.engine.socket_path;
    daemon_options.connect_timeout_ms = config.engine.connect_timeout_ms;
    daemon_options.response_timeout_ms = config.engine.response_timeout_ms;
    auto daemon = std::make_shared<const engine::DaemonClient>(daemon_options);
    auto ping = daemon->ping();
    if (core::errors::is_error(ping)) {
        report("Engine daemon unreachable at " + config.engine.socket_path.string(),
               core::errors::get_error(ping));
        return kExitStores;
    }
    handles.embeddings =
        std::make_shared<engine::RemoteEmbeddingIndex>(daemon, config.vector_db.collection_name);
    handles.graph = std::make_shared<engine::RemoteTemporalGraph>(daemon);
    handles.predictor = std::make_shared<engine::RemoteContextPredictor>(
        daemon, config.prediction.prediction_window);

    // 5. Privacy filter seeded from the configured blacklist
    policy::Blacklist blacklist;
    blacklist.apps.insert(config.privacy.blacklist_apps.begin(),
                          config.privacy.blacklist_apps.end());
    blacklist.directories.insert(config.privacy.blacklist_directories.begin(),
                                 config.privacy.blacklist_directories.end());
    const char* home = std::getenv("HOME");
    auto privacy = std::make_shared<policy::PrivacyFilter>(
        blacklist, std::make_shared<policy::JsonConfigBlacklistStore>(config.source_path),
        home != nullptr ? std::filesystem::path(home) : std::filesystem::path());

    // 6. Tools
    tools::ToolLimits limits;
    limits.max_graph_depth = config.graph.max_depth;
    limits.min_confidence = config.prediction.min_confidence;
    tools::ToolRegistry registry;
    auto registered = tools::register_context_tools(
        registry, std::make_shared<const tools::ContextTools>(handles, privacy, limits));
    if (core::errors::is_error(registered)) {
        report("Tool registration failed", core::errors::get_error(registered));
        return kExitConfig;
    }
    registry.seal();

    // 7. Serve
    runtime::WorkerPool handler_pool(config.server.worker_threads);
    runtime::DispatchOptions dispatch_options;
    dispatch_options.handler_timeout_ms = config.server.handler_timeout_ms;
    runtime::Dispatcher dispatcher(registry, *privacy, handler_pool, dispatch_options);

    session::ResponseWriter writer(std::cout);
    session::LoopOptions loop_options;
    loop_options.intake_workers = options.intake_workers.value_or(config.server.worker_threads);
    session::TransportLoop loop(dispatcher, registry, writer, loop_options);

    g_loop = &loop;
    install_signal_handlers();
    const int code = loop.run(std::cin);
    g_loop = nullptr;

    LOG_INFO("Context continuity server: stopped after " +
             std::to_string(writer.frames_written()) + " frames");
    return code;
}
