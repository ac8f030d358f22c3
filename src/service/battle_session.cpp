/// @file battle_session.cpp
/// @brief BattleSession implementation.

#include "duel/service/battle_session.hpp"

#include <string>
#include <utility>

#include "duel/foundation/duel_logger.hpp"

namespace duel::service {

using duel::battle::ActionKind;
using duel::battle::ActionReport;
using duel::battle::Match;
using duel::battle::MatchPhase;
using duel::battle::MatchResult;
using duel::foundation::DuelError;
using duel::foundation::DuelResult;
using duel::foundation::ErrorCode;
using duel::foundation::LogCategory;

namespace {

DuelResult<ActionReport> invalidState(const std::string& what, MatchPhase phase) {
    return DuelResult<ActionReport>::err(DuelError(
        ErrorCode::InvalidState,
        what + " (phase " + std::string(duel::battle::matchPhaseName(phase)) + ")"));
}

} // namespace

BattleSession::BattleSession(duel::battle::BattleConfig config,
                             duel::battle::IProgressStore& store,
                             duel::foundation::RandomSource& random,
                             duel::battle::IBattleEventSink* sink)
    : config_(std::move(config)), store_(store), random_(random), sink_(sink) {}

DuelResult<ActionReport> BattleSession::startNewGame() {
    if (auto written = store_.setPlayerLevel(config_.leveling.newGamePlayerLevel); !written) {
        return DuelResult<ActionReport>::err(written.error());
    }
    if (auto written = store_.setEnemyLevel(duel::battle::kDefaultProgressLevel); !written) {
        return DuelResult<ActionReport>::err(written.error());
    }
    DUEL_LOG_INFO(LogCategory::Session,
                  "new game at level " + std::to_string(config_.leveling.newGamePlayerLevel));
    return beginMatch();
}

DuelResult<ActionReport> BattleSession::continueGame() {
    DUEL_LOG_INFO(LogCategory::Session, "continuing saved run");
    return beginMatch();
}

DuelResult<ActionReport> BattleSession::nextBattle() {
    if (!match_) {
        return DuelResult<ActionReport>::err(
            DuelError(ErrorCode::NoActiveMatch, "no match has been played yet"));
    }
    if (match_->result() != MatchResult::Won) {
        return invalidState("next battle requires a won match", match_->phase());
    }
    return beginMatch();
}

DuelResult<ActionReport> BattleSession::retry() {
    if (!match_) {
        return DuelResult<ActionReport>::err(
            DuelError(ErrorCode::NoActiveMatch, "no match has been played yet"));
    }
    if (match_->result() != MatchResult::Lost) {
        return invalidState("retry requires a lost match", match_->phase());
    }
    if (auto reset = store_.resetProgress(); !reset) {
        return DuelResult<ActionReport>::err(reset.error());
    }
    DUEL_LOG_INFO(LogCategory::Session, "retrying from level 1");
    return beginMatch();
}

DuelResult<void> BattleSession::abandonRun() {
    if (auto reset = store_.resetProgress(); !reset) {
        return reset;
    }
    match_.reset();
    DUEL_LOG_INFO(LogCategory::Session, "run abandoned");
    return DuelResult<void>::ok();
}

DuelResult<ActionReport> BattleSession::act(ActionKind kind) {
    if (!match_) {
        return DuelResult<ActionReport>::err(
            DuelError(ErrorCode::NoActiveMatch, "no match to act in"));
    }
    auto report = match_->choose(kind);
    tally(report);
    return DuelResult<ActionReport>::ok(std::move(report));
}

DuelResult<ActionReport> BattleSession::beginMatch() {
    auto created = Match::create(config_, store_, random_, sink_);
    if (!created) {
        return DuelResult<ActionReport>::err(created.error());
    }
    match_ = std::move(created).value();

    auto report = match_->start();
    tally(report);
    return DuelResult<ActionReport>::ok(std::move(report));
}

void BattleSession::tally(const ActionReport& report) {
    if (report.status != duel::battle::ActionStatus::Resolved || !match_->isOver()) {
        return;
    }
    ++matchesPlayed_;
    if (match_->result() == MatchResult::Won) {
        ++matchesWon_;
    }
}

} // namespace duel::service
