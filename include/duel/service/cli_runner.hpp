#pragma once

/// @file cli_runner.hpp
/// @brief Shared utilities for the command-line entry point.

#include <cstdint>
#include <filesystem>
#include <optional>

#include "duel/foundation/config_manager.hpp"
#include "duel/foundation/duel_result.hpp"

namespace duel::service {

/// Default config file, relative to the working directory.
inline constexpr const char* kDefaultConfigPath = "config/duel.yaml";

/// Default progress file when "duel.save.path" is not configured.
inline constexpr const char* kDefaultSavePath = "duel_progress.yaml";

/// Parsed command line.
struct CliOptions {
    std::filesystem::path configPath;    ///< Empty when --config was not given.
    std::optional<uint64_t> seed;        ///< Random seed when --seed was given.
    uint32_t battles = 1;                ///< Matches to auto-play at most.
    bool newGame = false;                ///< Start over instead of continuing.
    bool help = false;
};

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. DUEL_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] duel::foundation::DuelResult<void>
loadConfig(duel::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

/// Parse the full duel_cli command line.
///
/// Recognized: --config <path>, --seed <n>, --battles <n>, --new-game,
/// --help. Anything else, a missing value or a malformed number fails
/// with InvalidArgument.
[[nodiscard]] duel::foundation::DuelResult<CliOptions>
parseCliOptions(int argc, char* argv[]);

/// One-screen usage text.
[[nodiscard]] const char* usageText() noexcept;

} // namespace duel::service
