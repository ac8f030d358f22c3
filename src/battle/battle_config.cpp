/// @file battle_config.cpp
/// @brief BattleConfig validation and loading.

#include "duel/battle/battle_config.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "duel/foundation/duel_logger.hpp"

namespace duel::battle {

using duel::foundation::ConfigManager;
using duel::foundation::DuelError;
using duel::foundation::DuelResult;
using duel::foundation::ErrorCode;
using duel::foundation::LogCategory;

namespace {

DuelResult<void> invalid(const std::string& key, const std::string& why) {
    DUEL_LOG_ERROR(LogCategory::Config, "invalid value for " + key + ": " + why);
    return DuelResult<void>::err(
        DuelError(ErrorCode::ConfigInvalidValue, key + ": " + why, key));
}

/// False for negatives, NaN and infinities.
bool isNonNegative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

DuelResult<void> validateProfile(const std::string& prefix, const StatProfile& p) {
    if (p.baseHp < 1) {
        return invalid(prefix + ".base_hp", "must be >= 1");
    }
    if (p.baseAttack < 1) {
        return invalid(prefix + ".base_attack", "must be >= 1");
    }
    if (p.baseSpeed < 1) {
        return invalid(prefix + ".base_speed", "must be >= 1");
    }
    if (p.baseDefense < 0) {
        return invalid(prefix + ".base_defense", "must be >= 0");
    }
    if (!isNonNegative(p.hpGrowth)) {
        return invalid(prefix + ".hp_growth", "must be finite and >= 0");
    }
    if (!isNonNegative(p.attackGrowth)) {
        return invalid(prefix + ".attack_growth", "must be finite and >= 0");
    }
    if (!isNonNegative(p.speedGrowthPerLevel)) {
        return invalid(prefix + ".speed_growth_per_level", "must be finite and >= 0");
    }
    if (!isNonNegative(p.defenseGrowthPerLevel)) {
        return invalid(prefix + ".defense_growth_per_level", "must be finite and >= 0");
    }
    return DuelResult<void>::ok();
}

DuelResult<void> validateMultiplierRange(const std::string& prefix, double lo, double hi) {
    if (!isNonNegative(lo)) {
        return invalid(prefix + ".min_multiplier", "must be finite and >= 0");
    }
    if (!isNonNegative(hi)) {
        return invalid(prefix + ".max_multiplier", "must be finite and >= 0");
    }
    if (lo > hi) {
        return invalid(prefix + ".min_multiplier", "must not exceed max_multiplier");
    }
    return DuelResult<void>::ok();
}

bool isProbability(double value) {
    return value >= 0.0 && value <= 1.0;
}

/// Overwrite @p out with the value at @p key if the key is present.
template <typename T>
DuelResult<void> readOptional(const ConfigManager& config, const std::string& key, T& out) {
    if (!config.hasKey(key)) {
        return DuelResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return DuelResult<void>::err(value.error());
    }
    out = value.value();
    return DuelResult<void>::ok();
}

DuelResult<void> readProfile(const ConfigManager& config, const std::string& prefix,
                             StatProfile& p) {
    for (auto result : {
             readOptional(config, prefix + ".name", p.name),
             readOptional(config, prefix + ".base_hp", p.baseHp),
             readOptional(config, prefix + ".hp_growth", p.hpGrowth),
             readOptional(config, prefix + ".base_attack", p.baseAttack),
             readOptional(config, prefix + ".attack_growth", p.attackGrowth),
             readOptional(config, prefix + ".base_speed", p.baseSpeed),
             readOptional(config, prefix + ".speed_growth_per_level", p.speedGrowthPerLevel),
             readOptional(config, prefix + ".base_defense", p.baseDefense),
             readOptional(config, prefix + ".defense_growth_per_level", p.defenseGrowthPerLevel),
         }) {
        if (!result) {
            return result;
        }
    }
    return DuelResult<void>::ok();
}

} // namespace

DuelResult<void> validateBattleConfig(const BattleConfig& config) {
    if (auto r = validateProfile("duel.player", config.player); !r) {
        return r;
    }
    if (auto r = validateProfile("duel.enemy", config.enemy); !r) {
        return r;
    }

    if (auto r = validateMultiplierRange("duel.damage", config.damage.minMultiplier,
                                         config.damage.maxMultiplier); !r) {
        return r;
    }
    if (!isProbability(config.damage.critChance)) {
        return invalid("duel.damage.crit_chance", "must be within [0, 1]");
    }
    if (!isNonNegative(config.damage.critMultiplier) || config.damage.critMultiplier < 1.0) {
        return invalid("duel.damage.crit_multiplier", "must be finite and >= 1");
    }

    if (auto r = validateMultiplierRange("duel.heal", config.heal.minMultiplier,
                                         config.heal.maxMultiplier); !r) {
        return r;
    }

    const auto& acc = config.accuracy;
    if (!isProbability(acc.baseHitChance)) {
        return invalid("duel.accuracy.base_hit_chance", "must be within [0, 1]");
    }
    if (!isNonNegative(acc.speedFactor)) {
        return invalid("duel.accuracy.speed_factor", "must be finite and >= 0");
    }
    if (!isProbability(acc.minHitChance)) {
        return invalid("duel.accuracy.min_hit_chance", "must be within [0, 1]");
    }
    if (!isProbability(acc.maxHitChance)) {
        return invalid("duel.accuracy.max_hit_chance", "must be within [0, 1]");
    }
    if (acc.minHitChance > acc.maxHitChance) {
        return invalid("duel.accuracy.min_hit_chance", "must not exceed max_hit_chance");
    }

    const auto& lv = config.leveling;
    if (lv.levelUpAmount < 0) {
        return invalid("duel.leveling.level_up_amount", "must be >= 0");
    }
    if (lv.enemyLevelMinOffset > lv.enemyLevelMaxOffset) {
        return invalid("duel.leveling.enemy_level_min_offset",
                       "must not exceed enemy_level_max_offset");
    }
    if (lv.newGamePlayerLevel < 1) {
        return invalid("duel.leveling.new_game_player_level", "must be >= 1");
    }

    if (config.defenseConstant <= 0) {
        return invalid("duel.defense.constant", "must be > 0");
    }
    return DuelResult<void>::ok();
}

DuelResult<BattleConfig> loadBattleConfig(const ConfigManager& config) {
    BattleConfig out;

    for (auto result : {
             readProfile(config, "duel.player", out.player),
             readProfile(config, "duel.enemy", out.enemy),
             readOptional(config, "duel.damage.min_multiplier", out.damage.minMultiplier),
             readOptional(config, "duel.damage.max_multiplier", out.damage.maxMultiplier),
             readOptional(config, "duel.damage.crit_chance", out.damage.critChance),
             readOptional(config, "duel.damage.crit_multiplier", out.damage.critMultiplier),
             readOptional(config, "duel.heal.min_multiplier", out.heal.minMultiplier),
             readOptional(config, "duel.heal.max_multiplier", out.heal.maxMultiplier),
             readOptional(config, "duel.heal.minimum_heal_one", out.heal.minimumHealOne),
             readOptional(config, "duel.accuracy.base_hit_chance", out.accuracy.baseHitChance),
             readOptional(config, "duel.accuracy.speed_factor", out.accuracy.speedFactor),
             readOptional(config, "duel.accuracy.min_hit_chance", out.accuracy.minHitChance),
             readOptional(config, "duel.accuracy.max_hit_chance", out.accuracy.maxHitChance),
             readOptional(config, "duel.leveling.level_up_amount", out.leveling.levelUpAmount),
             readOptional(config, "duel.leveling.enemy_level_min_offset",
                          out.leveling.enemyLevelMinOffset),
             readOptional(config, "duel.leveling.enemy_level_max_offset",
                          out.leveling.enemyLevelMaxOffset),
             readOptional(config, "duel.leveling.new_game_player_level",
                          out.leveling.newGamePlayerLevel),
             readOptional(config, "duel.defense.constant", out.defenseConstant),
         }) {
        if (!result) {
            DUEL_LOG_ERROR(LogCategory::Config, std::string(result.error().message()));
            return DuelResult<BattleConfig>::err(result.error());
        }
    }

    if (auto valid = validateBattleConfig(out); !valid) {
        return DuelResult<BattleConfig>::err(valid.error());
    }
    return DuelResult<BattleConfig>::ok(std::move(out));
}

} // namespace duel::battle
