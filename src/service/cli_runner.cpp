/// @file cli_runner.cpp
/// @brief Implementation of command-line entry-point utilities.

#include "duel/service/cli_runner.hpp"

#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

namespace duel::service {

using duel::foundation::DuelError;
using duel::foundation::DuelResult;
using duel::foundation::ErrorCode;

namespace {

template <typename T>
std::optional<T> parseNumber(std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

DuelResult<CliOptions> badArgument(const std::string& message) {
    return DuelResult<CliOptions>::err(DuelError(ErrorCode::InvalidArgument, message));
}

} // namespace

// -- Config loading ----------------------------------------------------------

DuelResult<void> loadConfig(duel::foundation::ConfigManager& config,
                            const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("DUEL_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

DuelResult<CliOptions> parseCliOptions(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if (arg == "--new-game") {
            options.newGame = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            options.help = true;
            continue;
        }
        if (arg != "--config" && arg != "--seed" && arg != "--battles") {
            return badArgument("unknown argument: " + std::string(arg));
        }
        if (i + 1 >= argc) {
            return badArgument(std::string(arg) + " needs a value");
        }
        std::string_view value(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if (arg == "--config") {
            options.configPath = std::string(value);
        } else if (arg == "--seed") {
            auto seed = parseNumber<uint64_t>(value);
            if (!seed) {
                return badArgument("--seed expects an unsigned integer, got " + std::string(value));
            }
            options.seed = *seed;
        } else {
            auto battles = parseNumber<uint32_t>(value);
            if (!battles || *battles == 0) {
                return badArgument("--battles expects a positive integer, got " + std::string(value));
            }
            options.battles = *battles;
        }
    }

    return DuelResult<CliOptions>::ok(std::move(options));
}

const char* usageText() noexcept {
    return "usage: duel_cli [--config <file>] [--seed <n>] [--battles <n>] [--new-game]\n"
           "\n"
           "  --config <file>  YAML tunables (default config/duel.yaml,\n"
           "                   overridden by DUEL_CONFIG_PATH)\n"
           "  --seed <n>       replay a run deterministically\n"
           "  --battles <n>    stop after n matches (default 1)\n"
           "  --new-game       start a new run instead of continuing\n";
}

} // namespace duel::service
