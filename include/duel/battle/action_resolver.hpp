#pragma once

/// @file action_resolver.hpp
/// @brief Hit, damage, critical, heal and mitigation math.

#include <cstdint>

#include "duel/foundation/random_source.hpp"

namespace duel::battle {

/// Accuracy tunables. Speed difference shifts the base hit chance.
struct AccuracyParams {
    double baseHitChance = 0.95;
    double speedFactor = 0.01;   ///< Hit chance per point of speed difference.
    double minHitChance = 0.05;
    double maxHitChance = 1.0;
};

/// Damage roll tunables, applied to the attacker's attack stat.
struct DamageParams {
    double minMultiplier = 0.8;
    double maxMultiplier = 1.2;
    double critChance = 0.1;
    double critMultiplier = 1.5;
};

/// Heal roll tunables, applied to the healer's level.
struct HealParams {
    double minMultiplier = 0.5;
    double maxMultiplier = 1.5;
    bool minimumHealOne = false;  ///< Lift a rolled 0 to 1 when HP is missing.
};

/// Inclusive integer range.
struct RollRange {
    int32_t low = 0;
    int32_t high = 0;
};

/// Outcome of the accuracy check.
struct HitRoll {
    double chance = 0.0;
    double draw = 0.0;
    bool hit = false;
};

/// Outcome of a damage roll.
struct DamageRoll {
    int32_t base = 0;     ///< Uniform roll before the crit multiplier.
    int32_t amount = 0;   ///< Final raw damage (after crit).
    bool wasCrit = false;
};

/// Full attack: accuracy then, on a hit only, damage and crit.
struct AttackRoll {
    HitRoll hit;
    DamageRoll damage;  ///< Zeroed on a miss.
};

/// Combat formulas with every random draw taken from one injected source.
///
/// The static members are pure; the roll* members consume draws in a fixed
/// order so a seeded source replays identically:
///   rollAttack: unit (hit) -> [hit] int (damage) -> unit (crit)
///   rollHeal:   int (heal)
class ActionResolver {
public:
    explicit ActionResolver(duel::foundation::RandomSource& random) : random_(random) {}

    /// clamp(base + (attackerSpeed - defenderSpeed) * speedFactor, min, max)
    [[nodiscard]] static double hitChance(int32_t attackerSpeed, int32_t defenderSpeed,
                                          const AccuracyParams& params);

    /// [floor(attack * minMult), ceil(attack * maxMult)], low collapsed onto
    /// high if it ends up above it.
    [[nodiscard]] static RollRange damageRange(int32_t attack, const DamageParams& params);

    /// [floor(level * minMult), ceil(level * maxMult)] with the same collapse,
    /// both ends clamped to >= 0.
    [[nodiscard]] static RollRange healRange(int32_t level, const HealParams& params);

    /// max(1, round(raw * C / (C + defense))) for raw >= 1; 0 otherwise.
    [[nodiscard]] static int32_t mitigateDamage(int32_t raw, int32_t defense,
                                                int32_t defenseConstant);

    /// One uniform draw; hit when draw <= chance.
    HitRoll rollHit(int32_t attackerSpeed, int32_t defenderSpeed, const AccuracyParams& params);

    /// Uniform integer in damageRange(), then an independent crit draw
    /// (crit when draw < critChance, amount = ceil(amount * critMultiplier)).
    DamageRoll rollDamage(int32_t attack, const DamageParams& params);

    /// rollHit, then rollDamage only if it hit.
    AttackRoll rollAttack(int32_t attack, int32_t attackerSpeed, int32_t defenderSpeed,
                          const AccuracyParams& accuracy, const DamageParams& damage);

    /// Uniform integer in healRange(), optionally lifted to 1, then capped
    /// at @p missingHp.
    int32_t rollHeal(int32_t level, int32_t missingHp, const HealParams& params);

private:
    duel::foundation::RandomSource& random_;
};

} // namespace duel::battle
