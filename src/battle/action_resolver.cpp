/// @file action_resolver.cpp
/// @brief ActionResolver implementation.

#include "duel/battle/action_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "duel/battle/stat_scaler.hpp"
#include "duel/foundation/duel_logger.hpp"

namespace duel::battle {

using duel::foundation::LogCategory;

// ── Pure formulas ───────────────────────────────────────────────────────

double ActionResolver::hitChance(int32_t attackerSpeed, int32_t defenderSpeed,
                                 const AccuracyParams& params) {
    double chance = params.baseHitChance
        + static_cast<double>(attackerSpeed - defenderSpeed) * params.speedFactor;
    return std::clamp(chance, params.minHitChance, params.maxHitChance);
}

RollRange ActionResolver::damageRange(int32_t attack, const DamageParams& params) {
    RollRange range;
    range.low = StatScaler::saturate(std::floor(attack * params.minMultiplier), 0);
    range.high = StatScaler::saturate(std::ceil(attack * params.maxMultiplier), 0);
    if (range.low > range.high) {
        range.low = range.high;
    }
    return range;
}

RollRange ActionResolver::healRange(int32_t level, const HealParams& params) {
    RollRange range;
    range.low = StatScaler::saturate(std::floor(level * params.minMultiplier), 0);
    range.high = StatScaler::saturate(std::ceil(level * params.maxMultiplier), 0);
    if (range.low > range.high) {
        range.low = range.high;
    }
    return range;
}

int32_t ActionResolver::mitigateDamage(int32_t raw, int32_t defense, int32_t defenseConstant) {
    if (raw <= 0) {
        return 0;
    }
    double constant = static_cast<double>(defenseConstant);
    double scaled = static_cast<double>(raw) * constant
        / (constant + static_cast<double>(std::max<int32_t>(defense, 0)));
    return StatScaler::saturate(std::nearbyint(scaled), 1);
}

// ── Rolls ───────────────────────────────────────────────────────────────

HitRoll ActionResolver::rollHit(int32_t attackerSpeed, int32_t defenderSpeed,
                                const AccuracyParams& params) {
    HitRoll roll;
    roll.chance = hitChance(attackerSpeed, defenderSpeed, params);
    roll.draw = random_.nextUnit();
    roll.hit = roll.draw <= roll.chance;
    return roll;
}

DamageRoll ActionResolver::rollDamage(int32_t attack, const DamageParams& params) {
    auto range = damageRange(attack, params);

    DamageRoll roll;
    roll.base = random_.nextInt(range.low, range.high);
    roll.amount = roll.base;
    roll.wasCrit = random_.nextUnit() < params.critChance;
    if (roll.wasCrit) {
        roll.amount = StatScaler::saturate(
            std::ceil(static_cast<double>(roll.base) * params.critMultiplier), 0);
    }

    DUEL_LOG_DEBUG(LogCategory::Combat,
                   "damage roll " + std::to_string(roll.base) + " in ["
                   + std::to_string(range.low) + ", " + std::to_string(range.high) + "]"
                   + (roll.wasCrit ? " crit -> " + std::to_string(roll.amount) : std::string()));
    return roll;
}

AttackRoll ActionResolver::rollAttack(int32_t attack, int32_t attackerSpeed,
                                      int32_t defenderSpeed,
                                      const AccuracyParams& accuracy,
                                      const DamageParams& damage) {
    AttackRoll roll;
    roll.hit = rollHit(attackerSpeed, defenderSpeed, accuracy);
    if (!roll.hit.hit) {
        DUEL_LOG_DEBUG(LogCategory::Combat,
                       "miss (draw " + std::to_string(roll.hit.draw) + " > chance "
                       + std::to_string(roll.hit.chance) + ")");
        return roll;
    }
    roll.damage = rollDamage(attack, damage);
    return roll;
}

int32_t ActionResolver::rollHeal(int32_t level, int32_t missingHp, const HealParams& params) {
    auto range = healRange(level, params);
    int32_t amount = random_.nextInt(range.low, range.high);
    if (params.minimumHealOne && amount == 0 && missingHp > 0) {
        amount = 1;
    }
    amount = std::min(amount, std::max<int32_t>(missingHp, 0));

    DUEL_LOG_DEBUG(LogCategory::Combat,
                   "heal roll in [" + std::to_string(range.low) + ", "
                   + std::to_string(range.high) + "] -> " + std::to_string(amount));
    return amount;
}

} // namespace duel::battle
