#pragma once

/// @file battle_types.hpp
/// @brief Enumerations shared by the battle modules.

#include <cstdint>
#include <string_view>

namespace duel::battle {

/// Which corner a combatant fights from.
enum class Side : uint8_t {
    Player,
    Enemy
};

/// Match state machine phases.
enum class MatchPhase : uint8_t {
    Setup,       ///< Combatants built, opening turn not yet decided.
    PlayerTurn,  ///< Waiting for the caller to choose an action.
    EnemyTurn,   ///< Enemy acting (resolved synchronously).
    Won,         ///< Enemy defeated. Terminal.
    Lost         ///< Player defeated. Terminal.
};

/// Terminal result of a match.
enum class MatchResult : uint8_t {
    None,
    Won,
    Lost
};

/// Player-selectable actions.
enum class ActionKind : uint8_t {
    Attack,
    Heal,
    Defend
};

[[nodiscard]] constexpr Side opponentOf(Side side) noexcept {
    return side == Side::Player ? Side::Enemy : Side::Player;
}

[[nodiscard]] constexpr bool isTerminal(MatchPhase phase) noexcept {
    return phase == MatchPhase::Won || phase == MatchPhase::Lost;
}

constexpr std::string_view sideName(Side side) {
    return side == Side::Player ? "player" : "enemy";
}

constexpr std::string_view matchPhaseName(MatchPhase phase) {
    switch (phase) {
        case MatchPhase::Setup:      return "Setup";
        case MatchPhase::PlayerTurn: return "PlayerTurn";
        case MatchPhase::EnemyTurn:  return "EnemyTurn";
        case MatchPhase::Won:        return "Won";
        case MatchPhase::Lost:       return "Lost";
    }
    return "Unknown";
}

constexpr std::string_view matchResultName(MatchResult result) {
    switch (result) {
        case MatchResult::None: return "None";
        case MatchResult::Won:  return "Won";
        case MatchResult::Lost: return "Lost";
    }
    return "Unknown";
}

constexpr std::string_view actionKindName(ActionKind kind) {
    switch (kind) {
        case ActionKind::Attack: return "Attack";
        case ActionKind::Heal:   return "Heal";
        case ActionKind::Defend: return "Defend";
    }
    return "Unknown";
}

} // namespace duel::battle
