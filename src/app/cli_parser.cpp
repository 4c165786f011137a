#include "cli_parser.hpp"
#include <charconv>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <vector>

namespace continuity::app::cli {

    using namespace continuity::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> engine_dir;
        std::optional<std::string> config;
        std::optional<std::string> socket;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> workers;
        bool sequential = false;
        bool verbose = false;
        bool help = false;
    };

    namespace {

        constexpr const char* kDefaultEngineDir = "Documents/PythonScripts/ContextContinuityEngine";

        std::optional<std::string> env(const char* name) {
            const char* value = std::getenv(name);
            if (value == nullptr || *value == '\0') {
                return std::nullopt;
            }
            return std::string(value);
        }

        std::filesystem::path expand_home(const std::string& raw) {
            if (!raw.empty() && raw[0] == '~' && (raw.size() == 1 || raw[1] == '/')) {
                auto home = env("HOME");
                if (home) {
                    return std::filesystem::path(home.value()) / raw.substr(raw.size() == 1 ? 1 : 2);
                }
            }
            return std::filesystem::path(raw);
        }

        // Exception-free integer parsing with inclusive bounds
        Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint32_t min, std::uint32_t max) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return ContinuityError{ErrorKind::Config, "Invalid number for " + flag, "invalid_integer",
                                       "Provide a non-negative integer."};
            }
            if (value < min || value > max) {
                return ContinuityError{ErrorKind::Config, flag + " out of bounds", "bounds_error",
                                       "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

    } // namespace

    std::string usage() {
        return "Usage: continuity_mcp [--engine-dir DIR] [--config PATH] [--socket PATH]\n"
               "                      [--timeout-ms N] [--workers N | --sequential] [--verbose]";
    }

    Result<ServerOptions> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto take_value = [&args](std::size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };
        for (std::size_t i = 0; i < args.size(); ++i) {
            bool ok = true;
            if (args[i] == "--engine-dir") {
                ok = take_value(i, raw.engine_dir);
            } else if (args[i] == "--config") {
                ok = take_value(i, raw.config);
            } else if (args[i] == "--socket") {
                ok = take_value(i, raw.socket);
            } else if (args[i] == "--timeout-ms") {
                ok = take_value(i, raw.timeout_ms);
            } else if (args[i] == "--workers") {
                ok = take_value(i, raw.workers);
            } else if (args[i] == "--sequential") {
                raw.sequential = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else {
                return ContinuityError{ErrorKind::Config, "Unknown argument: " + args[i], "unknown_argument", usage()};
            }
            if (!ok) {
                return ContinuityError{ErrorKind::Config, "Missing value for " + args[i], "missing_value"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerOptions options;
        options.verbose = raw.verbose;
        options.show_help = raw.help;

        if (raw.sequential && raw.workers) {
            return ContinuityError{ErrorKind::Config, "Cannot provide both --workers and --sequential", "conflicting_flags"};
        }

        if (raw.engine_dir) {
            options.engine_dir = expand_home(raw.engine_dir.value());
        } else if (auto from_env = env("CONTINUITY_ENGINE_DIR")) {
            options.engine_dir = expand_home(from_env.value());
        } else if (auto home = env("HOME")) {
            options.engine_dir = std::filesystem::path(home.value()) / kDefaultEngineDir;
        } else {
            return ContinuityError{ErrorKind::Config, "Cannot determine the engine directory", "missing_engine_dir",
                                   "Pass --engine-dir or set CONTINUITY_ENGINE_DIR."};
        }
        options.engine_dir = options.engine_dir.lexically_normal();

        options.config_path = raw.config ? expand_home(raw.config.value())
                                         : options.engine_dir / "config" / "default_config.json";

        if (raw.socket) {
            if (raw.socket->empty()) {
                return ContinuityError{ErrorKind::Config, "--socket cannot be empty", "invalid_path"};
            }
            options.socket_path = expand_home(raw.socket.value());
        }

        if (raw.timeout_ms) {
            auto parsed = parse_bounded("--timeout-ms", raw.timeout_ms.value(), 1, 600000);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            options.timeout_ms = get_value(parsed);
        }

        if (raw.workers) {
            auto parsed = parse_bounded("--workers", raw.workers.value(), 0, 64);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            options.intake_workers = get_value(parsed);
        } else if (raw.sequential) {
            options.intake_workers = 0;
        }

        return options;
    }

} // namespace continuity::app::cli
