#pragma once

/// @file match_outcome.hpp
/// @brief Win/loss consequences: leveling and persisted progress.

#include <cstdint>
#include <optional>

#include "duel/battle/battle_config.hpp"
#include "duel/battle/battle_events.hpp"
#include "duel/battle/battle_types.hpp"
#include "duel/battle/combatant.hpp"
#include "duel/battle/progress_store.hpp"
#include "duel/foundation/duel_error.hpp"

namespace duel::battle {

/// What applying an outcome did.
struct OutcomeReport {
    MatchResult result = MatchResult::None;
    int32_t levelsGained = 0;
    int32_t playerLevel = 0;   ///< Player level after leveling.
    bool bestLevelRaised = false;
    BattleEventList events;    ///< LeveledUp / BestLevelRaised, in order.
    std::optional<duel::foundation::DuelError> persistenceError;  ///< First failure.
};

/// Applies the consequences of a finished match.
///
/// Won:  player.levelUp(levelUpAmount); persist player level; raise the
///       persisted best level if the new level beats it.
/// Lost: raise the persisted best level if the current level beats it.
///       Player and enemy levels are left alone; wiping them is the
///       separate resetProgress() operation.
///
/// Persistence failures never undo in-memory leveling. The first one is
/// returned in the report and the remaining steps still run.
class MatchOutcomeHandler {
public:
    MatchOutcomeHandler(IProgressStore& store, LevelingParams leveling)
        : store_(store), leveling_(leveling) {}

    OutcomeReport apply(MatchResult result, Combatant& player);

private:
    void raiseBestLevel(int32_t level, OutcomeReport& report);
    void recordFailure(const duel::foundation::DuelError& error, OutcomeReport& report);

    IProgressStore& store_;
    LevelingParams leveling_;
};

} // namespace duel::battle
