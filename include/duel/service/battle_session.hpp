#pragma once

/// @file battle_session.hpp
/// @brief Run flow across matches: new game, continue, next battle, retry.

#include <cstdint>
#include <memory>

#include "duel/battle/battle_config.hpp"
#include "duel/battle/battle_events.hpp"
#include "duel/battle/battle_types.hpp"
#include "duel/battle/match.hpp"
#include "duel/battle/progress_store.hpp"
#include "duel/foundation/duel_result.hpp"
#include "duel/foundation/random_source.hpp"

namespace duel::service {

/// Drives a run of consecutive matches against one progress store.
///
/// Menu flow:
///   main menu  -> startNewGame() | continueGame()
///   after win  -> nextBattle()
///   after loss -> retry() | abandonRun()
///
/// Every call that begins a match returns the report of Match::start().
/// Calls that do not fit the current state fail with InvalidState (or
/// NoActiveMatch when no match was ever begun) and change nothing.
class BattleSession {
public:
    BattleSession(duel::battle::BattleConfig config,
                  duel::battle::IProgressStore& store,
                  duel::foundation::RandomSource& random,
                  duel::battle::IBattleEventSink* sink = nullptr);

    /// Write player level = newGamePlayerLevel and enemy level = 1, then
    /// begin a match. The best level is kept.
    duel::foundation::DuelResult<duel::battle::ActionReport> startNewGame();

    /// Begin a match from the saved levels.
    duel::foundation::DuelResult<duel::battle::ActionReport> continueGame();

    /// Begin the next match after a win.
    duel::foundation::DuelResult<duel::battle::ActionReport> nextBattle();

    /// Reset progress and begin a fresh match after a loss.
    duel::foundation::DuelResult<duel::battle::ActionReport> retry();

    /// Reset progress and drop the current match.
    duel::foundation::DuelResult<void> abandonRun();

    /// Forward a player choice to the current match.
    duel::foundation::DuelResult<duel::battle::ActionReport> act(duel::battle::ActionKind kind);

    [[nodiscard]] bool hasMatch() const noexcept { return match_ != nullptr; }
    [[nodiscard]] duel::battle::Match* match() noexcept { return match_.get(); }
    [[nodiscard]] const duel::battle::Match* match() const noexcept { return match_.get(); }

    [[nodiscard]] uint32_t matchesPlayed() const noexcept { return matchesPlayed_; }
    [[nodiscard]] uint32_t matchesWon() const noexcept { return matchesWon_; }

private:
    duel::foundation::DuelResult<duel::battle::ActionReport> beginMatch();
    void tally(const duel::battle::ActionReport& report);

    duel::battle::BattleConfig config_;
    duel::battle::IProgressStore& store_;
    duel::foundation::RandomSource& random_;
    duel::battle::IBattleEventSink* sink_;
    std::unique_ptr<duel::battle::Match> match_;
    uint32_t matchesPlayed_ = 0;
    uint32_t matchesWon_ = 0;
};

} // namespace duel::service
