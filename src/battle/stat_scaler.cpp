/// @file stat_scaler.cpp
/// @brief StatScaler implementation.

#include "duel/battle/stat_scaler.hpp"

#include <algorithm>
#include <cmath>

namespace duel::battle {

namespace {

int32_t clampLevel(int32_t level) {
    return std::max<int32_t>(level, 1);
}

double logCurve(int32_t level) {
    return std::log(static_cast<double>(clampLevel(level)) + 1.0);
}

} // namespace

int32_t StatScaler::maxHpFor(int32_t level, int32_t baseHp, double hpGrowth) {
    double raw = static_cast<double>(baseHp) * logCurve(level) * hpGrowth;
    return saturate(std::floor(raw), 1);
}

int32_t StatScaler::attackFor(int32_t level, int32_t baseAttack, double attackGrowth) {
    double raw = static_cast<double>(baseAttack) * logCurve(level) * attackGrowth;
    return saturate(std::ceil(raw), 1);
}

int32_t StatScaler::speedFor(int32_t level, int32_t baseSpeed, double growthPerLevel) {
    double raw = static_cast<double>(baseSpeed)
        + growthPerLevel * static_cast<double>(clampLevel(level) - 1);
    // Ties go to the even neighbour (default floating-point rounding mode).
    return saturate(std::nearbyint(raw), 1);
}

int32_t StatScaler::defenseFor(int32_t level, int32_t baseDefense, double growthPerLevel) {
    double raw = static_cast<double>(baseDefense)
        + growthPerLevel * static_cast<double>(clampLevel(level) - 1);
    return saturate(std::floor(raw), 0);
}

int32_t StatScaler::saturate(double value, int32_t lowest) noexcept {
    if (std::isnan(value) || value <= static_cast<double>(lowest)) {
        return lowest;
    }
    if (value >= static_cast<double>(kMaxStatValue)) {
        return kMaxStatValue;
    }
    return static_cast<int32_t>(value);
}

int32_t StatScaler::offsetLevel(int32_t level, int64_t delta) noexcept {
    int64_t sum = static_cast<int64_t>(level) + delta;
    return static_cast<int32_t>(std::clamp<int64_t>(sum, 1, kMaxLevel));
}

DerivedStats StatScaler::compute(int32_t level, const StatProfile& profile) {
    DerivedStats stats;
    stats.maxHp = maxHpFor(level, profile.baseHp, profile.hpGrowth);
    stats.attack = attackFor(level, profile.baseAttack, profile.attackGrowth);
    stats.speed = speedFor(level, profile.baseSpeed, profile.speedGrowthPerLevel);
    stats.defense = defenseFor(level, profile.baseDefense, profile.defenseGrowthPerLevel);
    return stats;
}

} // namespace duel::battle
