#pragma once

/// @file combatant.hpp
/// @brief One fighter: level, derived stats, current HP and defend stance.

#include <cstdint>
#include <string>

#include "duel/battle/battle_types.hpp"
#include "duel/battle/stat_scaler.hpp"

namespace duel::battle {

/// Reference value for the defense mitigation constant.
inline constexpr int32_t kDefaultDefenseConstant = 100;

/// What a single takeDamage() call did.
struct DamageReceipt {
    int32_t raw = 0;         ///< Damage offered, clamped to >= 0.
    int32_t applied = 0;     ///< Damage after mitigation (HP actually lost may be lower at 0 HP).
    bool mitigated = false;  ///< Defend stance reduced this hit.
    bool defeated = false;   ///< currentHp <= 0 afterwards.
};

/// Mutable battle entity.
///
/// Invariants: 0 <= currentHp() <= maxHp(); level() >= 1 and never decreases.
/// Stats are recomputed through StatScaler whenever the level changes.
class Combatant {
public:
    Combatant(Side side, StatProfile profile,
              int32_t defenseConstant = kDefaultDefenseConstant);

    /// Set the level (clamped to >= 1), recompute stats and heal to full.
    void initialize(int32_t level);

    /// Gain @p levels levels and heal by exactly the max HP increase.
    ///
    /// No-op for levels <= 0.
    /// @return The max HP increase that was healed.
    int32_t levelUp(int32_t levels = 1);

    /// Apply damage, mitigated first if the defend stance is up.
    ///
    /// mitigated = max(1, round(amount * C / (C + defense))), C = defense constant.
    /// The stance is left up; it lapses at the start of this side's next turn.
    DamageReceipt takeDamage(int32_t amount);

    /// Heal by @p amount (clamped to >= 0), never past maxHp().
    /// @return HP actually restored.
    int32_t heal(int32_t amount);

    void startDefending() noexcept { defending_ = true; }
    void endDefending() noexcept { defending_ = false; }

    [[nodiscard]] Side side() const noexcept { return side_; }
    [[nodiscard]] const std::string& name() const noexcept { return profile_.name; }
    [[nodiscard]] const StatProfile& profile() const noexcept { return profile_; }
    [[nodiscard]] int32_t level() const noexcept { return level_; }
    [[nodiscard]] const DerivedStats& stats() const noexcept { return stats_; }
    [[nodiscard]] int32_t maxHp() const noexcept { return stats_.maxHp; }
    [[nodiscard]] int32_t attack() const noexcept { return stats_.attack; }
    [[nodiscard]] int32_t speed() const noexcept { return stats_.speed; }
    [[nodiscard]] int32_t defense() const noexcept { return stats_.defense; }
    [[nodiscard]] int32_t currentHp() const noexcept { return currentHp_; }
    [[nodiscard]] int32_t missingHp() const noexcept { return stats_.maxHp - currentHp_; }
    [[nodiscard]] bool isDefending() const noexcept { return defending_; }
    [[nodiscard]] bool isDefeated() const noexcept { return currentHp_ <= 0; }
    [[nodiscard]] bool isAtFullHealth() const noexcept { return currentHp_ >= stats_.maxHp; }

private:
    void recalculate();

    Side side_;
    StatProfile profile_;
    int32_t defenseConstant_;
    int32_t level_ = 1;
    DerivedStats stats_;
    int32_t currentHp_ = 0;
    bool defending_ = false;
};

} // namespace duel::battle
