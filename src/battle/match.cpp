/// @file match.cpp
/// @brief Match state machine implementation.

#include "duel/battle/match.hpp"

#include <algorithm>
#include <atomic>
#include <string>

#include "duel/foundation/duel_logger.hpp"

namespace duel::battle {

using duel::foundation::DuelError;
using duel::foundation::DuelResult;
using duel::foundation::LogCategory;
using duel::foundation::LogContext;
using duel::foundation::LogLevel;
using duel::foundation::RandomSource;

namespace {

uint64_t nextMatchId() noexcept {
    static std::atomic<uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

} // namespace

// ── Construction ────────────────────────────────────────────────────────

DuelResult<std::unique_ptr<Match>> Match::create(const BattleConfig& config,
                                                 IProgressStore& store,
                                                 RandomSource& random,
                                                 IBattleEventSink* sink) {
    if (auto valid = validateBattleConfig(config); !valid) {
        return DuelResult<std::unique_ptr<Match>>::err(valid.error());
    }

    auto savedLevel = store.getPlayerLevel();
    if (!savedLevel) {
        DUEL_LOG_ERROR(LogCategory::Persistence,
                       "cannot read player level: " + std::string(savedLevel.error().message()));
        return DuelResult<std::unique_ptr<Match>>::err(savedLevel.error());
    }
    int32_t playerLevel = std::max<int32_t>(savedLevel.value(), 1);

    int32_t offset = random.nextInt(config.leveling.enemyLevelMinOffset,
                                    config.leveling.enemyLevelMaxOffset);
    int32_t enemyLevel = StatScaler::offsetLevel(playerLevel, offset);

    auto match = std::make_unique<Match>(
        CreateKey{}, config, store, random, sink, playerLevel, enemyLevel);
    return DuelResult<std::unique_ptr<Match>>::ok(std::move(match));
}

Match::Match(CreateKey,
             const BattleConfig& config,
             IProgressStore& store,
             RandomSource& random,
             IBattleEventSink* sink,
             int32_t playerLevel,
             int32_t enemyLevel)
    : config_(config),
      store_(store),
      sink_(sink),
      resolver_(random),
      outcome_(store, config_.leveling),
      player_(Side::Player, config_.player, config_.defenseConstant),
      enemy_(Side::Enemy, config_.enemy, config_.defenseConstant),
      id_(nextMatchId()) {
    player_.initialize(playerLevel);
    enemy_.initialize(enemyLevel);

    LogContext ctx;
    ctx.matchId = id_;
    ctx.extra["player_level"] = std::to_string(player_.level());
    ctx.extra["enemy_level"] = std::to_string(enemy_.level());
    duel::foundation::DuelLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Turn, "match created", ctx);
}

// ── Entry points ────────────────────────────────────────────────────────

ActionReport Match::start() {
    if (phase_ != MatchPhase::Setup) {
        ActionReport report;
        report.status = isOver() ? ActionStatus::MatchAlreadyEnded : ActionStatus::Ignored;
        report.phase = phase_;
        return report;
    }

    ActionReport report;
    report.status = ActionStatus::Resolved;

    // Saved before the first turn so an abandoned match still shows the
    // enemy the player was facing.
    if (auto saved = store_.setEnemyLevel(enemy_.level()); !saved) {
        recordPersistenceFailure(saved.error(), report);
    }

    BattleEvent started;
    started.type = BattleEventType::MatchStarted;
    started.actor = Side::Player;
    started.target = Side::Enemy;
    started.level = player_.level();
    started.amount = enemy_.level();
    emit(started, report);

    if (player_.speed() >= enemy_.speed()) {
        beginTurn(Side::Player, report);
    } else {
        runEnemyTurn(report);
    }

    report.phase = phase_;
    return report;
}

ActionReport Match::chooseAttack() {
    if (auto rejected = rejectUnlessPlayerTurn(ActionKind::Attack)) {
        return *rejected;
    }
    ActionReport report;
    report.status = ActionStatus::Resolved;

    if (resolveAttack(player_, enemy_, report)) {
        finish(MatchResult::Won, report);
    } else {
        runEnemyTurn(report);
    }
    report.phase = phase_;
    return report;
}

ActionReport Match::chooseHeal() {
    if (auto rejected = rejectUnlessPlayerTurn(ActionKind::Heal)) {
        return *rejected;
    }
    ActionReport report;

    if (player_.isAtFullHealth()) {
        // Free re-prompt: the turn is not consumed.
        BattleEvent rejectedHeal;
        rejectedHeal.type = BattleEventType::HealRejected;
        rejectedHeal.actor = Side::Player;
        rejectedHeal.target = Side::Player;
        rejectedHeal.remainingHp = player_.currentHp();
        emit(rejectedHeal, report);
        report.status = ActionStatus::Reprompted;
        report.phase = phase_;
        return report;
    }

    report.status = ActionStatus::Resolved;
    int32_t amount = resolver_.rollHeal(player_.level(), player_.missingHp(), config_.heal);
    int32_t restored = player_.heal(amount);

    BattleEvent healed;
    healed.type = BattleEventType::Healed;
    healed.actor = Side::Player;
    healed.target = Side::Player;
    healed.amount = restored;
    healed.remainingHp = player_.currentHp();
    emit(healed, report);

    runEnemyTurn(report);
    report.phase = phase_;
    return report;
}

ActionReport Match::chooseDefend() {
    if (auto rejected = rejectUnlessPlayerTurn(ActionKind::Defend)) {
        return *rejected;
    }
    ActionReport report;
    report.status = ActionStatus::Resolved;

    player_.startDefending();
    BattleEvent defend;
    defend.type = BattleEventType::DefendStarted;
    defend.actor = Side::Player;
    defend.target = Side::Player;
    emit(defend, report);

    runEnemyTurn(report);
    report.phase = phase_;
    return report;
}

ActionReport Match::choose(ActionKind kind) {
    switch (kind) {
        case ActionKind::Attack: return chooseAttack();
        case ActionKind::Heal:   return chooseHeal();
        case ActionKind::Defend: return chooseDefend();
    }
    return rejectUnlessPlayerTurn(kind).value_or(ActionReport{});
}

MatchSummary Match::summary() const {
    MatchSummary s;
    s.result = result_;
    s.phase = phase_;
    s.playerLevel = player_.level();
    s.enemyLevel = enemy_.level();
    s.playerHp = player_.currentHp();
    s.playerMaxHp = player_.maxHp();
    s.enemyHp = enemy_.currentHp();
    s.enemyMaxHp = enemy_.maxHp();
    s.turns = turns_;
    return s;
}

// ── State machine internals ─────────────────────────────────────────────

std::optional<ActionReport> Match::rejectUnlessPlayerTurn(ActionKind kind) const {
    if (phase_ == MatchPhase::PlayerTurn) {
        return std::nullopt;
    }
    ActionReport report;
    report.phase = phase_;
    report.status = isOver() ? ActionStatus::MatchAlreadyEnded : ActionStatus::Ignored;
    DUEL_LOG_DEBUG(LogCategory::Turn,
                   std::string(actionKindName(kind)) + " ignored in phase "
                   + std::string(matchPhaseName(phase_)));
    return report;
}

void Match::beginTurn(Side side, ActionReport& report) {
    phase_ = side == Side::Player ? MatchPhase::PlayerTurn : MatchPhase::EnemyTurn;
    ++turns_;

    BattleEvent turn;
    turn.type = BattleEventType::TurnChanged;
    turn.actor = side;
    turn.target = opponentOf(side);
    emit(turn, report);

    // A defend stance covers the opponent's turn only.
    auto& self = combatant(side);
    if (self.isDefending()) {
        self.endDefending();
        BattleEvent lapsed;
        lapsed.type = BattleEventType::DefendEnded;
        lapsed.actor = side;
        lapsed.target = side;
        emit(lapsed, report);
    }

    DUEL_LOG_DEBUG(LogCategory::Turn,
                   "turn " + std::to_string(turns_) + ": " + std::string(sideName(side)));
}

void Match::runEnemyTurn(ActionReport& report) {
    beginTurn(Side::Enemy, report);
    if (resolveAttack(enemy_, player_, report)) {
        finish(MatchResult::Lost, report);
        return;
    }
    beginTurn(Side::Player, report);
}

bool Match::resolveAttack(Combatant& attacker, Combatant& defender, ActionReport& report) {
    auto roll = resolver_.rollAttack(attacker.attack(), attacker.speed(), defender.speed(),
                                     config_.accuracy, config_.damage);
    if (!roll.hit.hit) {
        BattleEvent missed;
        missed.type = BattleEventType::Missed;
        missed.actor = attacker.side();
        missed.target = defender.side();
        missed.remainingHp = defender.currentHp();
        emit(missed, report);
        return false;
    }

    if (roll.damage.wasCrit) {
        BattleEvent crit;
        crit.type = BattleEventType::CriticalHit;
        crit.actor = attacker.side();
        crit.target = defender.side();
        crit.wasCrit = true;
        emit(crit, report);
    }

    auto receipt = defender.takeDamage(roll.damage.amount);

    BattleEvent hit;
    hit.type = BattleEventType::Hit;
    hit.actor = attacker.side();
    hit.target = defender.side();
    hit.amount = receipt.applied;
    hit.rawAmount = receipt.raw;
    hit.remainingHp = defender.currentHp();
    hit.wasCrit = roll.damage.wasCrit;
    hit.mitigated = receipt.mitigated;
    emit(hit, report);

    if (!receipt.defeated) {
        return false;
    }

    BattleEvent defeated;
    defeated.type = BattleEventType::Defeated;
    defeated.actor = defender.side();
    defeated.target = defender.side();
    emit(defeated, report);
    return true;
}

void Match::finish(MatchResult result, ActionReport& report) {
    phase_ = result == MatchResult::Won ? MatchPhase::Won : MatchPhase::Lost;
    result_ = result;
    player_.endDefending();

    BattleEvent ended;
    ended.type = BattleEventType::MatchEnded;
    ended.actor = Side::Player;
    ended.target = Side::Enemy;
    ended.result = result;
    ended.level = player_.level();
    emit(ended, report);

    auto outcome = outcome_.apply(result, player_);
    for (const auto& event : outcome.events) {
        emit(event, report);
    }
    if (outcome.persistenceError) {
        recordPersistenceFailure(*outcome.persistenceError, report);
    }

    LogContext ctx;
    ctx.matchId = id_;
    ctx.extra["result"] = std::string(matchResultName(result));
    ctx.extra["turns"] = std::to_string(turns_);
    ctx.extra["player_level"] = std::to_string(player_.level());
    duel::foundation::DuelLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Turn, "match ended", ctx);
}

void Match::emit(const BattleEvent& event, ActionReport& report) {
    report.events.push_back(event);
    if (sink_ != nullptr) {
        sink_->onBattleEvent(event);
    }
}

void Match::recordPersistenceFailure(const DuelError& error, ActionReport& report) {
    DUEL_LOG_WARN(LogCategory::Persistence,
                  "match " + std::to_string(id_) + ": " + std::string(error.message()));
    if (!report.persistenceError) {
        report.persistenceError = error;
    }
}

} // namespace duel::battle
