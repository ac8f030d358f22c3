#pragma once

/// @file match.hpp
/// @brief Match: the turn scheduler state machine for one player-vs-enemy fight.
///
///   Setup -> { PlayerTurn <-> EnemyTurn } -> { Won | Lost }
///
/// Every entry point resolves synchronously and returns the ordered events
/// it produced. The enemy acts inside the call that hands it the turn, so
/// from the caller's point of view the match is only ever waiting in
/// PlayerTurn or finished.

#include <cstdint>
#include <memory>
#include <optional>

#include "duel/battle/action_resolver.hpp"
#include "duel/battle/battle_config.hpp"
#include "duel/battle/battle_events.hpp"
#include "duel/battle/battle_types.hpp"
#include "duel/battle/combatant.hpp"
#include "duel/battle/match_outcome.hpp"
#include "duel/battle/progress_store.hpp"
#include "duel/foundation/duel_result.hpp"
#include "duel/foundation/random_source.hpp"

namespace duel::battle {

/// How an entry point treated the request.
enum class ActionStatus : uint8_t {
    Resolved,           ///< The action ran (and the turn passed on or the match ended).
    Reprompted,         ///< Heal at full HP: nothing happened, still the player's turn.
    Ignored,            ///< Out-of-phase request; no state change, no events.
    MatchAlreadyEnded   ///< Request after Won/Lost; no state change, no events.
};

/// Result of one entry point call.
struct ActionReport {
    ActionStatus status = ActionStatus::Ignored;
    MatchPhase phase = MatchPhase::Setup;   ///< Phase after the call.
    BattleEventList events;
    /// First persistence failure hit while resolving. The match itself is
    /// unaffected and stays playable.
    std::optional<duel::foundation::DuelError> persistenceError;

    [[nodiscard]] bool hasPersistenceError() const noexcept {
        return persistenceError.has_value();
    }
};

/// Final (or current) state for presentation.
struct MatchSummary {
    MatchResult result = MatchResult::None;
    MatchPhase phase = MatchPhase::Setup;
    int32_t playerLevel = 0;
    int32_t enemyLevel = 0;
    int32_t playerHp = 0;
    int32_t playerMaxHp = 0;
    int32_t enemyHp = 0;
    int32_t enemyMaxHp = 0;
    uint32_t turns = 0;
};

/// One match instance. Owns both combatants for its lifetime.
///
/// The progress store, random source and optional event sink are borrowed
/// and must outlive the match. Independent matches share nothing unless
/// the caller hands them the same collaborators.
///
/// Usage:
/// @code
///   auto created = Match::create(config, store, random);
///   if (!created) { ... }
///   auto& match = *created.value();
///   auto report = match.start();
///   while (!match.isOver()) {
///       report = match.chooseAttack();
///       replay(report.events);
///   }
/// @endcode
class Match {
    /// Restricts construction to create().
    struct CreateKey {
        explicit CreateKey() = default;
    };

public:
    /// Validate the configuration, read the persisted player level, roll the
    /// enemy level and build both combatants. The match is left in Setup.
    ///
    /// @return ConfigInvalidValue, PersistenceReadFailed or the match.
    [[nodiscard]] static duel::foundation::DuelResult<std::unique_ptr<Match>> create(
        const BattleConfig& config,
        IProgressStore& store,
        duel::foundation::RandomSource& random,
        IBattleEventSink* sink = nullptr);

    Match(CreateKey,
          const BattleConfig& config,
          IProgressStore& store,
          duel::foundation::RandomSource& random,
          IBattleEventSink* sink,
          int32_t playerLevel,
          int32_t enemyLevel);

    ~Match() = default;

    Match(const Match&) = delete;
    Match& operator=(const Match&) = delete;

    /// Persist the enemy level, announce the match and hand the first turn
    /// to the faster side (player on ties). If the enemy opens, its turn is
    /// resolved before this returns.
    ActionReport start();

    ActionReport chooseAttack();
    ActionReport chooseHeal();
    ActionReport chooseDefend();

    /// Dispatch by kind.
    ActionReport choose(ActionKind kind);

    [[nodiscard]] MatchPhase phase() const noexcept { return phase_; }
    [[nodiscard]] MatchResult result() const noexcept { return result_; }
    [[nodiscard]] bool isOver() const noexcept { return isTerminal(phase_); }
    [[nodiscard]] const Combatant& player() const noexcept { return player_; }
    [[nodiscard]] const Combatant& enemy() const noexcept { return enemy_; }
    [[nodiscard]] const BattleConfig& config() const noexcept { return config_; }
    [[nodiscard]] uint32_t turnCount() const noexcept { return turns_; }
    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] MatchSummary summary() const;

private:
    /// Ignored / MatchAlreadyEnded report, or nullopt when the player may act.
    [[nodiscard]] std::optional<ActionReport> rejectUnlessPlayerTurn(ActionKind kind) const;

    void beginTurn(Side side, ActionReport& report);
    void runEnemyTurn(ActionReport& report);

    /// Roll and apply one attack. @return true if the defender fell.
    bool resolveAttack(Combatant& attacker, Combatant& defender, ActionReport& report);

    void finish(MatchResult result, ActionReport& report);

    void emit(const BattleEvent& event, ActionReport& report);
    void recordPersistenceFailure(const duel::foundation::DuelError& error,
                                  ActionReport& report);

    Combatant& combatant(Side side) noexcept {
        return side == Side::Player ? player_ : enemy_;
    }

    BattleConfig config_;
    IProgressStore& store_;
    IBattleEventSink* sink_;
    ActionResolver resolver_;
    MatchOutcomeHandler outcome_;
    Combatant player_;
    Combatant enemy_;
    MatchPhase phase_ = MatchPhase::Setup;
    MatchResult result_ = MatchResult::None;
    uint32_t turns_ = 0;
    uint64_t id_ = 0;
};

} // namespace duel::battle
