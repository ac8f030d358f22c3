#pragma once

/// @file battle_config.hpp
/// @brief Match tunables, validation and YAML loading.

#include <cstdint>

#include "duel/battle/action_resolver.hpp"
#include "duel/battle/combatant.hpp"
#include "duel/battle/stat_scaler.hpp"
#include "duel/foundation/config_manager.hpp"
#include "duel/foundation/duel_result.hpp"

namespace duel::battle {

/// Progression tunables.
struct LevelingParams {
    int32_t levelUpAmount = 1;         ///< Levels gained per win.
    int32_t enemyLevelMinOffset = -1;  ///< Enemy level = player level + offset,
    int32_t enemyLevelMaxOffset = 2;   ///< offset uniform in [min, max].
    int32_t newGamePlayerLevel = 1;    ///< Player level written by "new game".
};

/// Every tunable a match reads at setup.
struct BattleConfig {
    StatProfile player = defaultPlayerProfile();
    StatProfile enemy = defaultEnemyProfile();
    AccuracyParams accuracy;
    DamageParams damage;
    HealParams heal;
    LevelingParams leveling;
    int32_t defenseConstant = kDefaultDefenseConstant;

    [[nodiscard]] const StatProfile& profileFor(Side side) const noexcept {
        return side == Side::Player ? player : enemy;
    }

    static StatProfile defaultPlayerProfile() {
        StatProfile profile;
        profile.name = "Player";
        return profile;
    }

    static StatProfile defaultEnemyProfile() {
        StatProfile profile;
        profile.name = "Enemy";
        return profile;
    }
};

/// Reject configurations the engine must not run with.
///
/// Nothing is swapped or repaired: the first violation is returned as
/// ConfigInvalidValue with the dotted key (std::string) as context.
[[nodiscard]] duel::foundation::DuelResult<void> validateBattleConfig(const BattleConfig& config);

/// Build a BattleConfig from "duel.*" keys.
///
/// Absent keys keep their defaults; present keys of the wrong type fail with
/// ConfigTypeMismatch. The result is validated before it is returned.
///
/// Recognized keys:
/// @code
///   duel.player.{name, base_hp, hp_growth, base_attack, attack_growth,
///                base_speed, speed_growth_per_level, base_defense,
///                defense_growth_per_level}
///   duel.enemy.{...same...}
///   duel.damage.{min_multiplier, max_multiplier, crit_chance, crit_multiplier}
///   duel.heal.{min_multiplier, max_multiplier, minimum_heal_one}
///   duel.accuracy.{base_hit_chance, speed_factor, min_hit_chance, max_hit_chance}
///   duel.leveling.{level_up_amount, enemy_level_min_offset,
///                  enemy_level_max_offset, new_game_player_level}
///   duel.defense.constant
/// @endcode
[[nodiscard]] duel::foundation::DuelResult<BattleConfig> loadBattleConfig(
    const duel::foundation::ConfigManager& config);

} // namespace duel::battle
