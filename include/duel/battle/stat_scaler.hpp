#pragma once

/// @file stat_scaler.hpp
/// @brief Level -> derived stat formulas.

#include <cstdint>
#include <limits>
#include <string>

namespace duel::battle {

/// Highest reachable level; level arithmetic saturates here.
inline constexpr int32_t kMaxLevel = std::numeric_limits<int32_t>::max();

/// Highest value any derived stat, damage or heal amount can take.
inline constexpr int32_t kMaxStatValue = std::numeric_limits<int32_t>::max();

/// Base values and growth factors for one combatant archetype.
struct StatProfile {
    std::string name = "Unit";
    int32_t baseHp = 20;
    double hpGrowth = 2.5;
    int32_t baseAttack = 5;
    double attackGrowth = 1.5;
    int32_t baseSpeed = 10;
    double speedGrowthPerLevel = 0.5;
    int32_t baseDefense = 0;
    double defenseGrowthPerLevel = 0.0;
};

/// Stats derived from a level.
struct DerivedStats {
    int32_t maxHp = 1;
    int32_t attack = 1;
    int32_t speed = 1;
    int32_t defense = 0;

    bool operator==(const DerivedStats&) const = default;
};

/// Static calculator mapping (level, profile) to derived stats.
///
/// Formulas, with L = max(level, 1):
///   maxHp   = max(1, floor(baseHp     * ln(L + 1) * hpGrowth))
///   attack  = max(1, ceil (baseAttack * ln(L + 1) * attackGrowth))
///   speed   = max(1, round(baseSpeed  + speedGrowthPerLevel * (L - 1)))
///   defense = max(0, floor(baseDefense + defenseGrowthPerLevel * (L - 1)))
///
/// HP rounds down, attack rounds up and speed rounds to nearest (ties to
/// even). The rounding modes differ on purpose and must stay that way.
/// Results saturate at kMaxStatValue, so huge growth factors or levels
/// never wrap or collapse to the floor value.
class StatScaler {
public:
    StatScaler() = delete;

    [[nodiscard]] static DerivedStats compute(int32_t level, const StatProfile& profile);

    [[nodiscard]] static int32_t maxHpFor(int32_t level, int32_t baseHp, double hpGrowth);
    [[nodiscard]] static int32_t attackFor(int32_t level, int32_t baseAttack, double attackGrowth);
    [[nodiscard]] static int32_t speedFor(int32_t level, int32_t baseSpeed, double growthPerLevel);
    [[nodiscard]] static int32_t defenseFor(int32_t level, int32_t baseDefense, double growthPerLevel);

    /// Convert an already rounded value to int32, clamped to
    /// [lowest, kMaxStatValue]. NaN maps to @p lowest.
    [[nodiscard]] static int32_t saturate(double value, int32_t lowest) noexcept;

    /// level + delta, clamped to [1, kMaxLevel].
    [[nodiscard]] static int32_t offsetLevel(int32_t level, int64_t delta) noexcept;
};

} // namespace duel::battle
