/// @file match_outcome.cpp
/// @brief MatchOutcomeHandler implementation.

#include "duel/battle/match_outcome.hpp"

#include <string>

#include "duel/foundation/duel_logger.hpp"

namespace duel::battle {

using duel::foundation::DuelError;
using duel::foundation::LogCategory;

OutcomeReport MatchOutcomeHandler::apply(MatchResult result, Combatant& player) {
    OutcomeReport report;
    report.result = result;
    report.playerLevel = player.level();

    if (result == MatchResult::Won) {
        int32_t before = player.level();
        player.levelUp(leveling_.levelUpAmount);
        report.levelsGained = player.level() - before;
        report.playerLevel = player.level();

        if (report.levelsGained > 0) {
            BattleEvent event;
            event.type = BattleEventType::LeveledUp;
            event.actor = player.side();
            event.target = player.side();
            event.level = player.level();
            event.remainingHp = player.currentHp();
            report.events.push_back(event);
            DUEL_LOG_INFO(LogCategory::Outcome,
                          "player won, level " + std::to_string(before) + " -> "
                          + std::to_string(player.level()));
        }

        if (auto saved = store_.setPlayerLevel(player.level()); !saved) {
            recordFailure(saved.error(), report);
        }
        raiseBestLevel(player.level(), report);
    } else if (result == MatchResult::Lost) {
        DUEL_LOG_INFO(LogCategory::Outcome,
                      "player lost at level " + std::to_string(player.level()));
        raiseBestLevel(player.level(), report);
    }
    return report;
}

void MatchOutcomeHandler::raiseBestLevel(int32_t level, OutcomeReport& report) {
    auto best = store_.getBestLevel();
    if (!best) {
        recordFailure(best.error(), report);
        return;
    }
    if (level <= best.value()) {
        return;
    }
    if (auto saved = store_.setBestLevel(level); !saved) {
        recordFailure(saved.error(), report);
        return;
    }
    report.bestLevelRaised = true;

    BattleEvent event;
    event.type = BattleEventType::BestLevelRaised;
    event.actor = Side::Player;
    event.target = Side::Player;
    event.level = level;
    report.events.push_back(event);
    DUEL_LOG_INFO(LogCategory::Outcome, "new best level " + std::to_string(level));
}

void MatchOutcomeHandler::recordFailure(const DuelError& error, OutcomeReport& report) {
    DUEL_LOG_WARN(LogCategory::Persistence,
                  "progress not saved: " + std::string(error.message()));
    if (!report.persistenceError) {
        report.persistenceError = error;
    }
}

} // namespace duel::battle
