#include "tactical/monitor/position_monitor.hpp"
#include "tactical/domain/enum_strings.hpp"
#include "tactical/monitor/position_math.hpp"
#include "tactical/signal/target_ladder.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <utility>

namespace tactical {

PositionMonitor::PositionMonitor(EventBus& bus, CircuitBreaker& breaker,
                                 const domain::TacticalConfig& config,
                                 IdGenerator& ids, Options options)
    : bus_(bus),
      breaker_(breaker),
      config_(config),
      ids_(ids),
      options_(options),
      balance_(config.initial_balance) {}

PositionMonitor::PositionMonitor(EventBus& bus, CircuitBreaker& breaker,
                                 const domain::TacticalConfig& config,
                                 IdGenerator& ids)
    : PositionMonitor(bus, breaker, config, ids, Options{}) {}

// -----------------------------------------------------------------------------
// open: start tracking a freshly executed position
// -----------------------------------------------------------------------------
bool PositionMonitor::open(domain::Position position) {
  std::unique_lock lock(mutex_);
  if (positions_.count(position.id) > 0) {
    std::cerr << "[PositionMonitor] Duplicate position id " << position.id
              << " ignored\n";
    return false;
  }
  position.state = domain::PositionState::Open;
  if (position.initial_stop <= 0.0) {
    position.initial_stop = position.stop_loss;
  }
  std::cout << "[PositionMonitor] Opened " << position.id << " "
            << domain::toString(position.direction) << " "
            << position.symbol << " size=" << position.size
            << " @ " << position.entry_price
            << " stop=" << position.stop_loss
            << " liq=" << position.liquidation_price << "\n";
  const std::string id = position.id;
  positions_.emplace(id, std::move(position));
  return true;
}

// -----------------------------------------------------------------------------
// updatePrice: mark every open position on the symbol
// -----------------------------------------------------------------------------
std::vector<PositionClosedEvent> PositionMonitor::updatePrice(
    const std::string& symbol, double price, std::int64_t now_ms) {
  if (!std::isfinite(price) || price <= 0.0) {
    std::cerr << "[PositionMonitor] Ignoring invalid price " << price
              << " for " << symbol << "\n";
    return {};
  }

  std::vector<PendingClose> pending;
  {
    std::unique_lock lock(mutex_);
    std::optional<double> previous;
    if (auto it = last_prices_.find(symbol); it != last_prices_.end()) {
      previous = it->second;
    }
    last_prices_[symbol] = price;

    for (auto& [id, pos] : positions_) {
      if (pos.symbol != symbol || pos.state != domain::PositionState::Open) {
        continue;
      }
      try {
        if (auto decision = mark(pos, price, previous, now_ms)) {
          // Claimed for closing before any side effect runs.
          pos.state = domain::PositionState::Closing;
          decision->position = pos;
          pending.push_back(std::move(*decision));
        }
      } catch (const std::exception& e) {
        std::cerr << "[PositionMonitor] Evaluation of " << id
                  << " failed: " << e.what() << "\n";
      }
    }
  }
  return completeAll(std::move(pending), now_ms);
}

// -----------------------------------------------------------------------------
// tick: re-evaluate every symbol at its last observed price
// -----------------------------------------------------------------------------
std::vector<PositionClosedEvent> PositionMonitor::tick(std::int64_t now_ms) {
  std::vector<std::pair<std::string, double>> prices;
  {
    std::shared_lock lock(mutex_);
    prices.assign(last_prices_.begin(), last_prices_.end());
  }
  std::vector<PositionClosedEvent> closed;
  for (const auto& [symbol, price] : prices) {
    auto events = updatePrice(symbol, price, now_ms);
    closed.insert(closed.end(), std::make_move_iterator(events.begin()),
                  std::make_move_iterator(events.end()));
  }
  return closed;
}

// -----------------------------------------------------------------------------
// closePosition / closeAll: externally requested closes
// -----------------------------------------------------------------------------
std::optional<PositionClosedEvent> PositionMonitor::closePosition(
    const std::string& id, double price, domain::CloseReason reason,
    std::int64_t now_ms) {
  PendingClose pending;
  {
    std::unique_lock lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() ||
        it->second.state != domain::PositionState::Open) {
      return std::nullopt;
    }
    it->second.state = domain::PositionState::Closing;
    pending.position = it->second;
    pending.reason = reason;
    pending.fill_price = price;
  }
  auto closed = completeAll({std::move(pending)}, now_ms);
  if (closed.empty()) {
    return std::nullopt;
  }
  return std::move(closed.front());
}

std::vector<PositionClosedEvent> PositionMonitor::closeAll(
    domain::CloseReason reason, std::int64_t now_ms) {
  std::vector<PendingClose> pending;
  {
    std::unique_lock lock(mutex_);
    for (auto& [id, pos] : positions_) {
      if (pos.state != domain::PositionState::Open) {
        continue;
      }
      auto price_it = last_prices_.find(pos.symbol);
      const double price =
          price_it != last_prices_.end() ? price_it->second : pos.entry_price;
      pos.state = domain::PositionState::Closing;
      pending.push_back(PendingClose{pos, reason, price});
    }
  }
  return completeAll(std::move(pending), now_ms);
}

// -----------------------------------------------------------------------------
// Read accessors
// -----------------------------------------------------------------------------
std::vector<domain::Position> PositionMonitor::getSnapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [id, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

std::optional<domain::Position> PositionMonitor::position(
    const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t PositionMonitor::openCount() const {
  std::shared_lock lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(positions_.begin(), positions_.end(), [](const auto& kv) {
        return kv.second.state == domain::PositionState::Open;
      }));
}

double PositionMonitor::balance() const {
  std::shared_lock lock(mutex_);
  return balance_;
}

std::vector<domain::JournalEntry> PositionMonitor::journal() const {
  std::shared_lock lock(mutex_);
  return journal_;
}

// -----------------------------------------------------------------------------
// mark: PnL, liquidation, stop, ladder (called under the exclusive lock)
// -----------------------------------------------------------------------------
std::optional<PositionMonitor::PendingClose> PositionMonitor::mark(
    domain::Position& pos, double price, std::optional<double> previous_price,
    std::int64_t now_ms) {
  const double open_size = pos.size * pos.remaining_fraction;
  pos.unrealized_pnl = PositionMath::pnl(pos.direction, pos.entry_price, price,
                                         open_size, pos.leverage);
  pos.unrealized_pnl_pct = PositionMath::pnlPct(
      pos.unrealized_pnl,
      PositionMath::margin(pos.entry_price, open_size, pos.leverage));

  const double move =
      PositionMath::favorableMovePct(pos.direction, pos.entry_price, price);
  pos.max_favorable_pct = std::max(pos.max_favorable_pct, move);
  pos.max_adverse_pct = std::max(pos.max_adverse_pct, -move);

  if (PositionMath::liquidationCrossed(pos, price)) {
    const bool prev_safe =
        previous_price &&
        !PositionMath::liquidationCrossed(pos, *previous_price);
    return PendingClose{
        {}, domain::CloseReason::Liquidated,
        triggerFill(pos.liquidation_price, price, previous_price, prev_safe)};
  }

  if (PositionMath::stopCrossed(pos, price)) {
    const bool prev_safe =
        previous_price && !PositionMath::stopCrossed(pos, *previous_price);
    return PendingClose{
        {}, domain::CloseReason::StopLoss,
        triggerFill(pos.stop_loss, price, previous_price, prev_safe)};
  }

  if (pos.targets.empty()) {
    if (auto reason = PositionMath::checkClose(pos, price)) {
      return PendingClose{{}, *reason, price};
    }
    return std::nullopt;
  }

  LadderUpdate update = TargetLadder::applyPrice(
      pos.targets, pos.direction, price, now_ms, pos.break_even_tier);
  if (update.empty()) {
    return std::nullopt;
  }

  for (const auto& fill : update.fills) {
    const double part = std::min(fill.fraction, pos.remaining_fraction);
    pos.realized_pnl += PositionMath::pnl(pos.direction, pos.entry_price,
                                          fill.fill_price, pos.size * part,
                                          pos.leverage);
    pos.remaining_fraction = std::max(0.0, pos.remaining_fraction - part);
    std::cout << "[PositionMonitor] " << pos.id << " target "
              << fill.index + 1 << " " << domain::toString(fill.status)
              << " @ " << fill.fill_price << " released "
              << part * 100.0 << "%\n";
  }

  if (update.break_even_triggered && !pos.break_even_moved) {
    pos.stop_loss = pos.entry_price;
    pos.break_even_moved = true;
    std::cout << "[PositionMonitor] " << pos.id
              << " stop moved to break-even " << pos.entry_price << "\n";
  }

  const double remaining_size = pos.size * pos.remaining_fraction;
  pos.unrealized_pnl = PositionMath::pnl(pos.direction, pos.entry_price, price,
                                         remaining_size, pos.leverage);
  pos.unrealized_pnl_pct = PositionMath::pnlPct(
      pos.unrealized_pnl,
      PositionMath::margin(pos.entry_price, remaining_size, pos.leverage));

  if (TargetLadder::allReleased(pos.targets)) {
    return PendingClose{{}, domain::CloseReason::TakeProfit, price};
  }
  return std::nullopt;
}

double PositionMonitor::triggerFill(double level, double price,
                                    std::optional<double> previous_price,
                                    bool previous_safe) const {
  if (options_.fill_at_trigger_level && previous_price && previous_safe) {
    return level;
  }
  return price;
}

// -----------------------------------------------------------------------------
// completeAll: run close side effects outside the lock, isolate failures
// -----------------------------------------------------------------------------
std::vector<PositionClosedEvent> PositionMonitor::completeAll(
    std::vector<PendingClose> pending, std::int64_t now_ms) {
  std::vector<PositionClosedEvent> closed;
  closed.reserve(pending.size());
  for (auto& p : pending) {
    const std::string id = p.position.id;
    try {
      closed.push_back(finishClose(std::move(p), now_ms));
    } catch (const std::exception& e) {
      std::cerr << "[PositionMonitor] Close of " << id << " failed: "
                << e.what() << ". Retrying on the next update.\n";
      releaseClaim(id);
      continue;
    }
    try {
      bus_.publish(closed.back());
    } catch (const std::exception& e) {
      std::cerr << "[PositionMonitor] PositionClosed handler for " << id
                << " failed: " << e.what() << "\n";
    }
  }
  return closed;
}

void PositionMonitor::releaseClaim(const std::string& id) {
  std::unique_lock lock(mutex_);
  auto it = positions_.find(id);
  if (it != positions_.end() &&
      it->second.state == domain::PositionState::Closing) {
    it->second.state = domain::PositionState::Open;
  }
}

// -----------------------------------------------------------------------------
// finishClose: final PnL, journal, outcome, breaker, balance
//
// Everything up to breaker_.record() only builds values. The breaker and
// the locked commit are the only effects, in that order: if record()
// throws, nothing has been applied and the claim can be released.
// -----------------------------------------------------------------------------
PositionClosedEvent PositionMonitor::finishClose(PendingClose pending,
                                                 std::int64_t now_ms) {
  domain::Position& pos = pending.position;
  const double fill = pending.fill_price;

  // Size-weighted exit over released tiers plus the final close.
  double exit_weight = 0.0;
  double exit_notional = 0.0;
  for (const auto& t : pos.targets) {
    if (t.status == domain::TargetStatus::Hit ||
        t.status == domain::TargetStatus::Missed) {
      exit_notional += t.fill_price * t.position_pct / 100.0;
      exit_weight += t.position_pct / 100.0;
    }
  }
  if (pos.remaining_fraction > 0.0) {
    pos.realized_pnl += PositionMath::pnl(pos.direction, pos.entry_price, fill,
                                          pos.size * pos.remaining_fraction,
                                          pos.leverage);
    exit_notional += fill * pos.remaining_fraction;
    exit_weight += pos.remaining_fraction;
  }
  const double exit_price =
      exit_weight > 0.0 ? exit_notional / exit_weight : fill;

  TargetLadder::cancelPending(pos.targets);
  pos.remaining_fraction = 0.0;
  pos.unrealized_pnl = 0.0;
  pos.unrealized_pnl_pct = 0.0;

  const double pnl = pos.realized_pnl;

  domain::JournalEntry journal;
  journal.id = ids_.next_tag("journal");
  journal.position_id = pos.id;
  journal.symbol = pos.symbol;
  journal.direction = pos.direction;
  journal.entry_price = pos.entry_price;
  journal.exit_price = exit_price;
  journal.size = pos.size;
  journal.leverage = pos.leverage;
  journal.pnl = pnl;
  journal.pnl_pct = PositionMath::pnlPct(
      pnl, PositionMath::margin(pos.entry_price, pos.size, pos.leverage));
  journal.entry_time_ms = pos.opened_at_ms;
  journal.exit_time_ms = now_ms;
  journal.reason = pending.reason;
  journal.notes = "signal " + pos.signal_id;
  journal.tags = {domain::toString(pos.fingerprint.regime),
                  domain::toString(pos.fingerprint.signal_type),
                  domain::toString(pending.reason)};
  journal.result = pnl > 0.0   ? domain::TradeResult::Win
                   : pnl < 0.0 ? domain::TradeResult::Loss
                               : domain::TradeResult::BreakEven;

  domain::TradeOutcome outcome;
  outcome.signal_id = pos.signal_id;
  outcome.symbol = pos.symbol;
  outcome.direction = pos.direction;
  outcome.fingerprint = pos.fingerprint;
  outcome.entry_price = pos.entry_price;
  outcome.exit_price = exit_price;
  outcome.entry_time_ms = pos.opened_at_ms;
  outcome.exit_time_ms = now_ms;
  outcome.exit_reason = pending.reason;
  const double risk_dollars = std::abs(pos.entry_price - pos.initial_stop) *
                              pos.size * pos.leverage;
  outcome.realized_r = risk_dollars > 0.0 ? pnl / risk_dollars : 0.0;
  outcome.realized_pnl = pnl;
  outcome.max_favorable_pct = pos.max_favorable_pct;
  outcome.max_adverse_pct = pos.max_adverse_pct;
  outcome.duration_ms = std::max<std::int64_t>(0, now_ms - pos.opened_at_ms);
  for (std::size_t i = 0; i < pos.targets.size(); ++i) {
    if (pos.targets[i].status == domain::TargetStatus::Hit) {
      outcome.targets_hit.push_back(static_cast<int>(i) + 1);
    }
  }

  breaker_.record(pnl);

  {
    std::unique_lock lock(mutex_);
    balance_ += pnl;
    journal_.push_back(journal);
    positions_.erase(pos.id);
  }
  pos.state = domain::PositionState::Closed;

  std::cout << "[PositionMonitor] Closed " << pos.id << " "
            << domain::toString(pending.reason) << " exit=" << exit_price
            << " pnl=" << pnl << " R=" << outcome.realized_r << "\n";

  PositionClosedEvent event;
  event.reason = pending.reason;
  event.journal = std::move(journal);
  event.outcome = std::move(outcome);
  event.timestamp_ms = now_ms;
  event.position = std::move(pos);
  return event;
}

}  // namespace tactical
