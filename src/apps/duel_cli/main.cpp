/// @file main.cpp
/// @brief duel_cli entry point.
///
/// Loads the tunables, opens the progress file and auto-plays a run of
/// matches, printing the battle dialogue to stdout.

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "duel/battle/battle_config.hpp"
#include "duel/foundation/config_manager.hpp"
#include "duel/foundation/duel_logger.hpp"
#include "duel/foundation/random_source.hpp"
#include "duel/service/auto_play.hpp"
#include "duel/service/battle_session.hpp"
#include "duel/service/cli_runner.hpp"
#include "duel/service/yaml_progress_store.hpp"
#include "duel/version.hpp"

namespace {

void warnPersistence(const duel::battle::ActionReport& report) {
    if (report.hasPersistenceError()) {
        DUEL_LOG_WARN(duel::foundation::LogCategory::Persistence,
                      "progress not saved: "
                      + std::string(report.persistenceError->message()));
        std::cerr << "warning: progress not saved: "
                  << report.persistenceError->message() << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = duel::service::parseCliOptions(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message() << "\n" << duel::service::usageText();
        return EXIT_FAILURE;
    }
    const auto& options = parsed.value();
    if (options.help) {
        std::cout << duel::service::usageText();
        return EXIT_SUCCESS;
    }

    auto configPath = options.configPath;
    if (configPath.empty()) {
        configPath = duel::service::kDefaultConfigPath;
    }

    duel::foundation::ConfigManager config;
    auto loadResult = duel::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto battleConfig = duel::battle::loadBattleConfig(config);
    if (!battleConfig) {
        std::cerr << "Invalid config: " << battleConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::string savePath = duel::service::kDefaultSavePath;
    if (auto configured = config.get<std::string>("duel.save.path")) {
        savePath = configured.value();
    }

    std::unique_ptr<duel::foundation::SeededRandomSource> random;
    if (options.seed) {
        random = std::make_unique<duel::foundation::SeededRandomSource>(*options.seed);
    } else {
        random = std::make_unique<duel::foundation::SeededRandomSource>();
    }

    DUEL_LOG_INFO(duel::foundation::LogCategory::Core,
                  std::string("duel ") + duel::Version::string + " seed "
                  + std::to_string(random->seed()));

    duel::service::YamlProgressStore store(savePath);
    duel::service::DialogueNarrator narrator(std::cout,
                                             battleConfig.value().player.name,
                                             battleConfig.value().enemy.name);
    duel::service::BattleSession session(battleConfig.value(), store, *random, &narrator);

    auto begun = (options.newGame || !store.hasSavedProgress())
                     ? session.startNewGame()
                     : session.continueGame();

    for (uint32_t battle = 1; ; ++battle) {
        if (!begun) {
            std::cerr << "Cannot start match: " << begun.error().message() << "\n";
            return EXIT_FAILURE;
        }
        warnPersistence(begun.value());

        while (!session.match()->isOver()) {
            auto kind = duel::service::chooseAutoAction(*session.match());
            auto acted = session.act(kind);
            if (!acted) {
                std::cerr << acted.error().message() << "\n";
                return EXIT_FAILURE;
            }
            warnPersistence(acted.value());
        }

        if (session.match()->result() == duel::battle::MatchResult::Lost
            || battle >= options.battles) {
            break;
        }
        std::cout << "\n";
        begun = session.nextBattle();
    }

    auto best = store.getBestLevel();
    std::cout << "\nWon " << session.matchesWon() << " of " << session.matchesPlayed()
              << " matches. Best level: "
              << (best ? std::to_string(best.value()) : std::string("unknown")) << "\n";

    if (auto flushed = duel::foundation::DuelLogger::instance().flush(); !flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
