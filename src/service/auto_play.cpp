/// @file auto_play.cpp
/// @brief Auto-play policy and dialogue narrator.

#include "duel/service/auto_play.hpp"

#include <cmath>
#include <utility>

#include "duel/battle/action_resolver.hpp"
#include "duel/battle/stat_scaler.hpp"

namespace duel::service {

using duel::battle::ActionKind;
using duel::battle::ActionResolver;
using duel::battle::BattleEvent;
using duel::battle::BattleEventType;
using duel::battle::MatchResult;
using duel::battle::Side;
using duel::battle::StatScaler;

ActionKind chooseAutoAction(const duel::battle::Match& match) {
    const auto& player = match.player();
    const auto& enemy = match.enemy();
    const auto& damage = match.config().damage;

    const bool wounded = static_cast<double>(player.currentHp())
                         < kAutoHealThreshold * static_cast<double>(player.maxHp());
    if (wounded && !player.isAtFullHealth()) {
        return ActionKind::Heal;
    }

    auto range = ActionResolver::damageRange(enemy.attack(), damage);
    auto worst = StatScaler::saturate(
        std::ceil(static_cast<double>(range.high) * damage.critMultiplier), 0);
    if (worst < player.currentHp()) {
        return ActionKind::Attack;
    }

    // Without defense the stance mitigates nothing; attacking is the only out.
    auto mitigated = ActionResolver::mitigateDamage(worst, player.defense(),
                                                    match.config().defenseConstant);
    return mitigated < worst ? ActionKind::Defend : ActionKind::Attack;
}

DialogueNarrator::DialogueNarrator(std::ostream& out, std::string playerName,
                                   std::string enemyName)
    : out_(out), playerName_(std::move(playerName)), enemyName_(std::move(enemyName)) {}

void DialogueNarrator::onBattleEvent(const BattleEvent& event) {
    const auto& actor = nameOf(event.actor);
    const auto& target = nameOf(event.target);

    switch (event.type) {
        case BattleEventType::MatchStarted:
            line("A wild " + enemyName_ + " (Lvl " + std::to_string(event.amount)
                 + ") appeared! " + playerName_ + " is Lvl " + std::to_string(event.level) + ".");
            break;
        case BattleEventType::TurnChanged:
            line(event.actor == Side::Player ? "Your turn!" : enemyName_ + "'s turn!");
            break;
        case BattleEventType::Missed:
            line(actor + " attacks... and misses!");
            break;
        case BattleEventType::CriticalHit:
            line("Critical hit!");
            break;
        case BattleEventType::Hit: {
            std::string text = actor + " deals " + std::to_string(event.amount)
                               + " damage to " + target;
            if (event.mitigated) {
                text += " (blocked " + std::to_string(event.rawAmount - event.amount) + ")";
            }
            line(text + ". " + target + " HP: " + std::to_string(event.remainingHp));
            break;
        }
        case BattleEventType::Healed:
            line(actor + " recovered " + std::to_string(event.amount) + " HP!");
            break;
        case BattleEventType::HealRejected:
            line("Already at full health!");
            break;
        case BattleEventType::DefendStarted:
            line(actor + " braces for the next attack.");
            break;
        case BattleEventType::DefendEnded:
            line(actor + " lowers their guard.");
            break;
        case BattleEventType::Defeated:
            line(actor + " has been defeated!");
            break;
        case BattleEventType::LeveledUp:
            line(actor + " grew to Lvl " + std::to_string(event.level) + "!");
            break;
        case BattleEventType::BestLevelRaised:
            line("New best: Lvl " + std::to_string(event.level) + ".");
            break;
        case BattleEventType::MatchEnded:
            line(event.result == MatchResult::Won ? "You Win!" : "You Lose!");
            break;
    }
}

const std::string& DialogueNarrator::nameOf(Side side) const noexcept {
    return side == Side::Player ? playerName_ : enemyName_;
}

void DialogueNarrator::line(const std::string& text) {
    out_ << text << '\n';
    ++lines_;
}

} // namespace duel::service
