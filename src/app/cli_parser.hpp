#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/continuity_errors.hpp"

namespace continuity::app::cli {

    // Validated command line. Unset optionals fall back to the engine configuration.
    struct ServerOptions {
        std::filesystem::path engine_dir;
        std::filesystem::path config_path;
        std::optional<std::filesystem::path> socket_path;
        std::optional<std::uint32_t> timeout_ms;
        std::optional<std::size_t> intake_workers;
        bool verbose = false;
        bool show_help = false;
    };

    std::string usage();

    continuity::core::errors::Result<ServerOptions> parse_and_validate(int argc, char* argv[]);
}
