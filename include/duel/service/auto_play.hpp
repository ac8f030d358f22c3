#pragma once

/// @file auto_play.hpp
/// @brief Scripted player policy and a text narrator for unattended runs.

#include <cstdint>
#include <ostream>
#include <string>

#include "duel/battle/battle_events.hpp"
#include "duel/battle/battle_types.hpp"
#include "duel/battle/match.hpp"

namespace duel::service {

/// HP fraction below which the policy heals.
inline constexpr double kAutoHealThreshold = 0.35;

/// Pick the player's action for the current turn.
///
///   heal    if HP < 35% of max (and not full)
///   defend  if the enemy's best possible hit (max roll, critical) would
///           finish the player and the player's defense reduces that hit
///   attack  otherwise
[[nodiscard]] duel::battle::ActionKind chooseAutoAction(const duel::battle::Match& match);

/// Writes one dialogue line per event, in the tone of the game's battle box.
class DialogueNarrator final : public duel::battle::IBattleEventSink {
public:
    DialogueNarrator(std::ostream& out, std::string playerName, std::string enemyName);

    void onBattleEvent(const duel::battle::BattleEvent& event) override;

    [[nodiscard]] uint64_t linesWritten() const noexcept { return lines_; }

private:
    [[nodiscard]] const std::string& nameOf(duel::battle::Side side) const noexcept;
    void line(const std::string& text);

    std::ostream& out_;
    std::string playerName_;
    std::string enemyName_;
    uint64_t lines_ = 0;
};

} // namespace duel::service
