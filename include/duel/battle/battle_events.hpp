#pragma once

/// @file battle_events.hpp
/// @brief Discrete events a match emits for the presentation layer.
///
/// The engine never waits on presentation. Each resolved action produces an
/// ordered list of events which the caller replays with its own timing
/// (dialogue lines, HP bars, animations, sounds).

#include <cstdint>
#include <string_view>
#include <vector>

#include "duel/battle/battle_types.hpp"

namespace duel::battle {

enum class BattleEventType : uint8_t {
    MatchStarted,     ///< actor=Player, level=player level, amount=enemy level.
    TurnChanged,      ///< actor = side whose turn begins.
    Missed,           ///< actor attacked target and missed.
    CriticalHit,      ///< actor rolled a critical; followed by Hit.
    Hit,              ///< actor damaged target.
    Healed,           ///< actor restored `amount` HP.
    HealRejected,     ///< actor tried to heal at full HP; turn not consumed.
    DefendStarted,    ///< actor raised the defend stance.
    DefendEnded,      ///< actor's defend stance lapsed.
    Defeated,         ///< actor fell to 0 HP.
    LeveledUp,        ///< actor reached `level`.
    BestLevelRaised,  ///< persisted best level is now `level`.
    MatchEnded        ///< result holds Won or Lost.
};

constexpr std::string_view battleEventTypeName(BattleEventType type) {
    switch (type) {
        case BattleEventType::MatchStarted:    return "MatchStarted";
        case BattleEventType::TurnChanged:     return "TurnChanged";
        case BattleEventType::Missed:          return "Missed";
        case BattleEventType::CriticalHit:     return "CriticalHit";
        case BattleEventType::Hit:             return "Hit";
        case BattleEventType::Healed:          return "Healed";
        case BattleEventType::HealRejected:    return "HealRejected";
        case BattleEventType::DefendStarted:   return "DefendStarted";
        case BattleEventType::DefendEnded:     return "DefendEnded";
        case BattleEventType::Defeated:        return "Defeated";
        case BattleEventType::LeveledUp:       return "LeveledUp";
        case BattleEventType::BestLevelRaised: return "BestLevelRaised";
        case BattleEventType::MatchEnded:      return "MatchEnded";
    }
    return "Unknown";
}

/// One presentation event. Fields not meaningful for a type stay zero.
struct BattleEvent {
    BattleEventType type = BattleEventType::TurnChanged;
    Side actor = Side::Player;
    Side target = Side::Enemy;
    int32_t amount = 0;        ///< Damage applied, HP healed, enemy level on start.
    int32_t rawAmount = 0;     ///< Damage before defend mitigation.
    int32_t remainingHp = 0;   ///< Target HP (Hit) or actor HP (Healed) afterwards.
    int32_t level = 0;
    bool wasCrit = false;
    bool mitigated = false;
    MatchResult result = MatchResult::None;
};

using BattleEventList = std::vector<BattleEvent>;

/// Write-only receiver for match events.
///
/// Called synchronously, in order, while an action resolves. Implementations
/// must not call back into the match that is emitting.
class IBattleEventSink {
public:
    virtual ~IBattleEventSink() = default;
    virtual void onBattleEvent(const BattleEvent& event) = 0;
};

} // namespace duel::battle
