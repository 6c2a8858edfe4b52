#pragma once

#include "tactical/concurrent/id_generator.hpp"
#include "tactical/domain/journal_entry.hpp"
#include "tactical/domain/position.hpp"
#include "tactical/domain/tactical_config.hpp"
#include "tactical/eventbus/event_bus.hpp"
#include "tactical/events/event_types.hpp"
#include "tactical/risk/circuit_breaker.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tactical {

// -----------------------------------------------------------------------------
// PositionMonitor — the single writer of position PnL and close transitions
// -----------------------------------------------------------------------------
//
// @brief  Prices open positions, advances their target ladders and closes
//         them on liquidation, stop-loss or take-profit.
//
// @details
// Per position, on every price update (strict order):
//   1. Unrealized PnL on the remaining fraction, MFE / MAE tracking.
//   2. Liquidation check (highest priority).
//   3. Stop-loss check.
//   4. Target ladder: released tiers realize PnL on their share; reaching
//      the break-even tier moves the stop to entry. All tiers released
//      closes the position as TakeProfit. Without a ladder the single
//      take_profit level is used.
//
// Close protocol:
//
//   [lock]   Open -> Closing, copy the position
//   [unlock] final PnL, journal entry, trade outcome, breaker update
//   [lock]   balance update, Closing -> Closed, remove from the open set
//   [unlock] publish PositionClosedEvent
//
// Any evaluation that finds a position in Closing skips it, so two ticks
// in quick succession never produce two close events.
//
// A std::exception thrown while evaluating or closing one position is
// logged and the remaining positions are still processed. A close that
// fails before its effects are applied returns the position to Open, so
// the next price update or tick retries it.
//
// Fill prices:
//   Live mode closes at the observed price. Options::fill_at_trigger_level
//   (used by the backtest) fills stops and liquidations at the trigger
//   level when the previous observed price was still on the safe side,
//   i.e. the level was crossed intra-bar rather than gapped through.
//
// Thread model:
//   Mutators run on the risk loop thread. getSnapshots(), balance() and
//   journal() are safe from any thread (std::shared_mutex), mirroring the
//   IPC server's read path.
//
// Ownership:
//   Holds references to the EventBus, CircuitBreaker, IdGenerator and
//   clock; all must outlive the monitor.
// -----------------------------------------------------------------------------
class PositionMonitor {
 public:
  struct Options {
    bool fill_at_trigger_level{false};
  };

  PositionMonitor(EventBus& bus, CircuitBreaker& breaker,
                  const domain::TacticalConfig& config, IdGenerator& ids,
                  Options options);
  PositionMonitor(EventBus& bus, CircuitBreaker& breaker,
                  const domain::TacticalConfig& config, IdGenerator& ids);

  PositionMonitor(const PositionMonitor&) = delete;
  PositionMonitor& operator=(const PositionMonitor&) = delete;
  PositionMonitor(PositionMonitor&&) = delete;
  PositionMonitor& operator=(PositionMonitor&&) = delete;

  /// Starts monitoring. Returns false if the id is already tracked.
  bool open(domain::Position position);

  /// Marks every open position on `symbol` at `price`.
  std::vector<PositionClosedEvent> updatePrice(const std::string& symbol,
                                               double price,
                                               std::int64_t now_ms);

  /// Re-evaluates every symbol at its last observed price.
  std::vector<PositionClosedEvent> tick(std::int64_t now_ms);

  std::optional<PositionClosedEvent> closePosition(const std::string& id,
                                                   double price,
                                                   domain::CloseReason reason,
                                                   std::int64_t now_ms);

  /// Closes every open position at the last observed price of its symbol.
  std::vector<PositionClosedEvent> closeAll(domain::CloseReason reason,
                                            std::int64_t now_ms);

  std::vector<domain::Position> getSnapshots() const;
  std::optional<domain::Position> position(const std::string& id) const;
  std::size_t openCount() const;

  double balance() const;
  std::vector<domain::JournalEntry> journal() const;

 private:
  struct PendingClose {
    domain::Position position;
    domain::CloseReason reason{domain::CloseReason::Manual};
    double fill_price{0.0};
  };

  // Mutates one Open position; returns a close decision if it must close.
  std::optional<PendingClose> mark(domain::Position& position, double price,
                                   std::optional<double> previous_price,
                                   std::int64_t now_ms);

  double triggerFill(double level, double price,
                     std::optional<double> previous_price,
                     bool previous_safe) const;

  PositionClosedEvent finishClose(PendingClose pending, std::int64_t now_ms);

  // Closing -> Open after a failed close.
  void releaseClaim(const std::string& id);

  std::vector<PositionClosedEvent> completeAll(
      std::vector<PendingClose> pending, std::int64_t now_ms);

  EventBus& bus_;
  CircuitBreaker& breaker_;
  domain::TacticalConfig config_;
  IdGenerator& ids_;
  Options options_;

  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::Position> positions_;  // Ordered by id
  std::unordered_map<std::string, double> last_prices_;
  double balance_{0.0};
  std::vector<domain::JournalEntry> journal_;
};

}  // namespace tactical
