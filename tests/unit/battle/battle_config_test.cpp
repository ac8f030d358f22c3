/// @file battle_config_test.cpp
/// @brief Unit tests for BattleConfig validation and YAML loading.

#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "duel/battle/battle_config.hpp"
#include "duel/foundation/config_manager.hpp"
#include "duel/foundation/error_code.hpp"

using namespace duel::battle;
using duel::foundation::ConfigManager;
using duel::foundation::ErrorCode;

namespace {

std::string invalidKey(const BattleConfig& config) {
    auto result = validateBattleConfig(config);
    if (result) {
        return {};
    }
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
    const auto* key = result.error().context<std::string>();
    return key != nullptr ? *key : std::string("<no key>");
}

} // namespace

// ============================================================================
// Validation
// ============================================================================

TEST(BattleConfigValidationTest, DefaultsAreValid) {
    EXPECT_TRUE(validateBattleConfig(BattleConfig{}).hasValue());
}

TEST(BattleConfigValidationTest, DefaultNames) {
    BattleConfig config;
    EXPECT_EQ(config.player.name, "Player");
    EXPECT_EQ(config.enemy.name, "Enemy");
    EXPECT_EQ(config.profileFor(Side::Enemy).name, "Enemy");
}

TEST(BattleConfigValidationTest, RejectsNonPositiveBaseStats) {
    BattleConfig config;
    config.player.baseHp = 0;
    EXPECT_EQ(invalidKey(config), "duel.player.base_hp");

    config = BattleConfig{};
    config.enemy.baseAttack = -1;
    EXPECT_EQ(invalidKey(config), "duel.enemy.base_attack");

    config = BattleConfig{};
    config.enemy.baseSpeed = 0;
    EXPECT_EQ(invalidKey(config), "duel.enemy.base_speed");

    config = BattleConfig{};
    config.player.baseDefense = -3;
    EXPECT_EQ(invalidKey(config), "duel.player.base_defense");
}

TEST(BattleConfigValidationTest, RejectsNegativeGrowth) {
    BattleConfig config;
    config.player.speedGrowthPerLevel = -0.5;
    EXPECT_EQ(invalidKey(config), "duel.player.speed_growth_per_level");
}

TEST(BattleConfigValidationTest, RejectsNonFiniteTunables) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    BattleConfig config;
    config.player.hpGrowth = nan;
    EXPECT_EQ(invalidKey(config), "duel.player.hp_growth");

    config = BattleConfig{};
    config.enemy.attackGrowth = inf;
    EXPECT_EQ(invalidKey(config), "duel.enemy.attack_growth");

    config = BattleConfig{};
    config.damage.maxMultiplier = inf;
    EXPECT_EQ(invalidKey(config), "duel.damage.max_multiplier");

    config = BattleConfig{};
    config.damage.critMultiplier = nan;
    EXPECT_EQ(invalidKey(config), "duel.damage.crit_multiplier");

    config = BattleConfig{};
    config.accuracy.speedFactor = nan;
    EXPECT_EQ(invalidKey(config), "duel.accuracy.speed_factor");
}

TEST(BattleConfigValidationTest, HugeFiniteGrowthIsAcceptedAndSaturates) {
    BattleConfig config;
    config.player.hpGrowth = 1e12;
    ASSERT_TRUE(validateBattleConfig(config).hasValue());
    EXPECT_EQ(StatScaler::compute(5, config.player).maxHp, kMaxStatValue);
}

TEST(BattleConfigValidationTest, RejectsInvertedMultipliersWithoutSwapping) {
    BattleConfig config;
    config.damage.minMultiplier = 1.5;
    config.damage.maxMultiplier = 1.0;
    EXPECT_EQ(invalidKey(config), "duel.damage.min_multiplier");
    EXPECT_DOUBLE_EQ(config.damage.minMultiplier, 1.5);

    config = BattleConfig{};
    config.heal.minMultiplier = -0.1;
    EXPECT_EQ(invalidKey(config), "duel.heal.min_multiplier");
}

TEST(BattleConfigValidationTest, RejectsBadCritSettings) {
    BattleConfig config;
    config.damage.critChance = 1.2;
    EXPECT_EQ(invalidKey(config), "duel.damage.crit_chance");

    config = BattleConfig{};
    config.damage.critMultiplier = 0.5;
    EXPECT_EQ(invalidKey(config), "duel.damage.crit_multiplier");
}

TEST(BattleConfigValidationTest, RejectsInvertedHitBounds) {
    BattleConfig config;
    config.accuracy.minHitChance = 0.9;
    config.accuracy.maxHitChance = 0.5;
    EXPECT_EQ(invalidKey(config), "duel.accuracy.min_hit_chance");

    config = BattleConfig{};
    config.accuracy.maxHitChance = 1.5;
    EXPECT_EQ(invalidKey(config), "duel.accuracy.max_hit_chance");
}

TEST(BattleConfigValidationTest, RejectsLevelingProblems) {
    BattleConfig config;
    config.leveling.enemyLevelMinOffset = 3;
    config.leveling.enemyLevelMaxOffset = 1;
    EXPECT_EQ(invalidKey(config), "duel.leveling.enemy_level_min_offset");

    config = BattleConfig{};
    config.leveling.levelUpAmount = -1;
    EXPECT_EQ(invalidKey(config), "duel.leveling.level_up_amount");

    config = BattleConfig{};
    config.leveling.newGamePlayerLevel = 0;
    EXPECT_EQ(invalidKey(config), "duel.leveling.new_game_player_level");
}

TEST(BattleConfigValidationTest, RejectsNonPositiveDefenseConstant) {
    BattleConfig config;
    config.defenseConstant = 0;
    EXPECT_EQ(invalidKey(config), "duel.defense.constant");
}

// ============================================================================
// Loading
// ============================================================================

TEST(BattleConfigLoadTest, EmptyConfigKeepsDefaults) {
    ConfigManager manager;
    auto loaded = loadBattleConfig(manager);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value().player.baseHp, 20);
    EXPECT_DOUBLE_EQ(loaded.value().damage.critChance, 0.1);
    EXPECT_EQ(loaded.value().leveling.enemyLevelMaxOffset, 2);
    EXPECT_EQ(loaded.value().defenseConstant, 100);
}

TEST(BattleConfigLoadTest, ReadsPresentKeys) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadFromString(R"(
duel:
  player:
    name: Hero
    base_hp: 30
    base_defense: 50
  enemy:
    speed_growth_per_level: 1.0
  damage:
    crit_chance: 0
  heal:
    minimum_heal_one: true
  leveling:
    level_up_amount: 2
    enemy_level_min_offset: 0
  defense:
    constant: 150
)").hasValue());

    auto loaded = loadBattleConfig(manager);
    ASSERT_TRUE(loaded.hasValue());
    const auto& config = loaded.value();
    EXPECT_EQ(config.player.name, "Hero");
    EXPECT_EQ(config.player.baseHp, 30);
    EXPECT_EQ(config.player.baseDefense, 50);
    EXPECT_DOUBLE_EQ(config.player.hpGrowth, 2.5);
    EXPECT_DOUBLE_EQ(config.enemy.speedGrowthPerLevel, 1.0);
    EXPECT_DOUBLE_EQ(config.damage.critChance, 0.0);
    EXPECT_TRUE(config.heal.minimumHealOne);
    EXPECT_EQ(config.leveling.levelUpAmount, 2);
    EXPECT_EQ(config.leveling.enemyLevelMinOffset, 0);
    EXPECT_EQ(config.defenseConstant, 150);
}

TEST(BattleConfigLoadTest, WrongTypeFails) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadFromString("duel:\n  player:\n    base_hp: lots\n").hasValue());
    auto loaded = loadBattleConfig(manager);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(BattleConfigLoadTest, LoadedValuesAreValidated) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadFromString(
        "duel:\n  heal:\n    min_multiplier: 2.0\n    max_multiplier: 1.0\n").hasValue());
    auto loaded = loadBattleConfig(manager);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigInvalidValue);
}
