/// @file full_run_test.cpp
/// @brief End-to-end runs: shipped config, seeded RNG, YAML save file.

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <sstream>

#include "duel/battle/battle_config.hpp"
#include "duel/foundation/config_manager.hpp"
#include "duel/foundation/random_source.hpp"
#include "duel/service/auto_play.hpp"
#include "duel/service/battle_session.hpp"
#include "duel/service/yaml_progress_store.hpp"
#include "recording_event_sink.hpp"
#include "temp_dir.hpp"

using namespace duel::battle;
using namespace duel::service;
using duel::foundation::ConfigManager;
using duel::foundation::SeededRandomSource;
using duel::test::RecordingEventSink;
using duel::test::TempDir;

namespace {

struct RunSummary {
    uint32_t played = 0;
    uint32_t won = 0;
    int32_t finalLevel = 0;
};

/// Auto-play up to @p battles matches, stopping at the first loss.
RunSummary autoPlay(BattleSession& session, uint32_t battles) {
    RunSummary summary;
    auto opening = session.startNewGame();
    EXPECT_TRUE(opening.hasValue());
    if (!opening) {
        return summary;
    }

    for (;;) {
        auto* match = session.match();
        for (int guard = 0; guard < 500 && !match->isOver(); ++guard) {
            auto report = session.act(chooseAutoAction(*match));
            EXPECT_TRUE(report.hasValue());
            EXPECT_GE(match->player().currentHp(), 0);
            EXPECT_LE(match->player().currentHp(), match->player().maxHp());
            EXPECT_GE(match->enemy().currentHp(), 0);
            EXPECT_LE(match->enemy().currentHp(), match->enemy().maxHp());
        }
        EXPECT_TRUE(match->isOver());
        summary.finalLevel = match->player().level();

        if (match->result() != MatchResult::Won || session.matchesPlayed() >= battles) {
            break;
        }
        auto next = session.nextBattle();
        EXPECT_TRUE(next.hasValue());
        if (!next) {
            break;
        }
    }
    summary.played = session.matchesPlayed();
    summary.won = session.matchesWon();
    return summary;
}

bool sameEvent(const BattleEvent& a, const BattleEvent& b) {
    return a.type == b.type && a.actor == b.actor && a.target == b.target
        && a.amount == b.amount && a.rawAmount == b.rawAmount
        && a.remainingHp == b.remainingHp && a.level == b.level
        && a.wasCrit == b.wasCrit && a.mitigated == b.mitigated && a.result == b.result;
}

} // namespace

// =============================================================================
// Integration fixture: shipped configuration over a real save file
// =============================================================================

class FullRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager manager;
        auto loaded = manager.load(std::filesystem::path(DUEL_SOURCE_DIR) / "config" / "duel.yaml");
        ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
        auto config = loadBattleConfig(manager);
        ASSERT_TRUE(config.hasValue()) << config.error().message();
        config_ = config.value();
    }

    BattleConfig config_;
    TempDir dir_;
};

TEST_F(FullRunTest, ShippedConfigMatchesDefaults) {
    BattleConfig defaults;
    EXPECT_EQ(config_.player.baseHp, defaults.player.baseHp);
    EXPECT_DOUBLE_EQ(config_.player.hpGrowth, defaults.player.hpGrowth);
    EXPECT_EQ(config_.enemy.baseAttack, defaults.enemy.baseAttack);
    EXPECT_DOUBLE_EQ(config_.accuracy.baseHitChance, defaults.accuracy.baseHitChance);
    EXPECT_DOUBLE_EQ(config_.damage.critChance, defaults.damage.critChance);
    EXPECT_DOUBLE_EQ(config_.heal.maxMultiplier, defaults.heal.maxMultiplier);
    EXPECT_EQ(config_.leveling.enemyLevelMaxOffset, defaults.leveling.enemyLevelMaxOffset);
    EXPECT_EQ(config_.defenseConstant, defaults.defenseConstant);
}

TEST_F(FullRunTest, SeededRunPersistsProgress) {
    auto savePath = dir_.file("save.yaml");
    YamlProgressStore store(savePath);
    SeededRandomSource random(2024);
    BattleSession session(config_, store, random);

    auto summary = autoPlay(session, 10);
    ASSERT_GE(summary.played, 1u);
    EXPECT_LE(summary.won, summary.played);

    YamlProgressStore reopened(savePath);
    auto best = reopened.getBestLevel();
    ASSERT_TRUE(best.hasValue());
    EXPECT_GE(best.value(), summary.finalLevel);
    EXPECT_EQ(reopened.getPlayerLevel().value(), summary.finalLevel);
    EXPECT_EQ(summary.finalLevel, 1 + static_cast<int32_t>(summary.won));
}

TEST_F(FullRunTest, SameSeedReplaysSameEvents) {
    RecordingEventSink first;
    RecordingEventSink second;
    {
        YamlProgressStore store(dir_.file("a.yaml"));
        SeededRandomSource random(77);
        BattleSession session(config_, store, random, &first);
        (void)autoPlay(session, 5);
    }
    {
        YamlProgressStore store(dir_.file("b.yaml"));
        SeededRandomSource random(77);
        BattleSession session(config_, store, random, &second);
        (void)autoPlay(session, 5);
    }

    ASSERT_EQ(first.events().size(), second.events().size());
    ASSERT_FALSE(first.events().empty());
    EXPECT_TRUE(std::equal(first.events().begin(), first.events().end(),
                           second.events().begin(), sameEvent));
}

TEST_F(FullRunTest, EnemyLevelsStayNearPlayerLevel) {
    YamlProgressStore store(dir_.file("save.yaml"));
    SeededRandomSource random(5);
    RecordingEventSink sink;
    BattleSession session(config_, store, random, &sink);
    (void)autoPlay(session, 20);

    for (const auto& event : sink.events()) {
        if (event.type != BattleEventType::MatchStarted) {
            continue;
        }
        const int32_t player = event.level;
        const int32_t enemy = event.amount;
        EXPECT_GE(enemy, std::max(1, player + config_.leveling.enemyLevelMinOffset));
        EXPECT_LE(enemy, std::max(1, player + config_.leveling.enemyLevelMaxOffset));
    }
}

TEST_F(FullRunTest, LostRunRetriesFromLevelOne) {
    config_.enemy.baseAttack = 1000;
    config_.enemy.baseSpeed = 100;
    YamlProgressStore store(dir_.file("save.yaml"));
    ASSERT_TRUE(store.setBestLevel(4).hasValue());
    SeededRandomSource random(9);
    BattleSession session(config_, store, random);

    ASSERT_TRUE(session.startNewGame().hasValue());
    ASSERT_EQ(session.match()->result(), MatchResult::Lost);

    ASSERT_TRUE(session.retry().hasValue());
    EXPECT_EQ(store.getPlayerLevel().value(), 1);
    EXPECT_EQ(store.getBestLevel().value(), 4);
}

TEST_F(FullRunTest, NarratorWritesOneLinePerEvent) {
    std::ostringstream out;
    DialogueNarrator narrator(out, config_.player.name, config_.enemy.name);
    YamlProgressStore store(dir_.file("save.yaml"));
    SeededRandomSource random(11);
    BattleSession session(config_, store, random, &narrator);
    (void)autoPlay(session, 3);

    const auto text = out.str();
    EXPECT_EQ(static_cast<uint64_t>(std::count(text.begin(), text.end(), '\n')),
              narrator.linesWritten());
    EXPECT_GT(narrator.linesWritten(), 0u);
}
