#include "tactical/validation/signal_validator.hpp"
#include "tactical/domain/enum_strings.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tactical {

namespace {

bool validPrice(double p) { return std::isfinite(p) && p > 0.0; }

domain::Rejection invalid(const std::string& why) {
  return domain::Rejection{domain::RejectStage::Validation, why};
}

}  // namespace

double SignalValidator::riskReward(double entry, double stop, double target) {
  const double risk = std::abs(entry - stop);
  if (risk == 0.0) {
    return 0.0;
  }
  return std::abs(target - entry) / risk;
}

std::size_t SignalValidator::primaryTargetIndex(std::size_t target_count) {
  return target_count > 1 ? 1 : 0;
}

double SignalValidator::deviationPct(double entry, double live_price) {
  if (live_price <= 0.0) {
    return 0.0;
  }
  return std::abs(entry - live_price) / live_price * 100.0;
}

bool SignalValidator::pricesOrdered(const domain::TradeSignal& signal) {
  const bool is_long = signal.direction == domain::Direction::Long;
  auto before = [is_long](double a, double b) {
    return is_long ? a < b : a > b;
  };

  if (!before(signal.stop_loss, signal.entry_price)) {
    return false;
  }
  double prev = signal.entry_price;
  for (const auto& t : signal.targets) {
    if (!before(prev, t.price)) {
      return false;
    }
    prev = t.price;
  }
  return true;
}

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
ValidationResult SignalValidator::validate(
    domain::EnhancedTradeSignal candidate, const ValidationContext& context,
    const domain::TacticalConfig& config) {
  if (!validPrice(candidate.entry_price) || !validPrice(candidate.stop_loss)) {
    return invalid("Entry or stop price failed to parse");
  }
  if (candidate.targets.empty()) {
    return invalid("No targets");
  }
  double pct_sum = 0.0;
  for (const auto& t : candidate.targets) {
    if (!validPrice(t.price)) {
      return invalid("Target price failed to parse");
    }
    pct_sum += t.position_pct;
  }
  if (std::abs(pct_sum - 100.0) > kPctSumTolerance) {
    std::ostringstream os;
    os << "Target allocation sums to " << pct_sum << "%, expected 100%";
    return invalid(os.str());
  }

  if (!pricesOrdered(candidate)) {
    std::ostringstream os;
    os << "Price ordering violated for " << domain::toString(candidate.direction)
       << " (stop " << candidate.stop_loss << ", entry "
       << candidate.entry_price << ")";
    return invalid(os.str());
  }

  if (!validPrice(context.live_price)) {
    return invalid("No live price to validate against");
  }
  const double deviation =
      deviationPct(candidate.entry_price, context.live_price);
  if (deviation > config.max_price_deviation_pct) {
    std::ostringstream os;
    os << "Entry " << candidate.entry_price << " deviates " << deviation
       << "% from live price " << context.live_price << " (max "
       << config.max_price_deviation_pct << "%)";
    return invalid(os.str());
  }

  if (!validPrice(context.atr)) {
    return invalid("ATR unavailable for stop distance check");
  }
  const double stop_atr =
      std::abs(candidate.entry_price - candidate.stop_loss) / context.atr;
  if (stop_atr < config.min_atr_stop_multiple ||
      stop_atr > config.max_atr_stop_multiple) {
    std::ostringstream os;
    os << "Stop distance " << stop_atr << " ATR outside ["
       << config.min_atr_stop_multiple << ", "
       << config.max_atr_stop_multiple << "]";
    return invalid(os.str());
  }

  const auto& primary =
      candidate.targets[primaryTargetIndex(candidate.targets.size())];
  candidate.risk_reward = riskReward(candidate.entry_price,
                                     candidate.stop_loss, primary.price);

  if (candidate.source != domain::SignalSource::Tactical) {
    candidate.approval_status = domain::ApprovalStatus::PendingReview;
  }
  if (candidate.current_stop <= 0.0) {
    candidate.current_stop = candidate.stop_loss;
  }
  if (candidate.entry_zone_low <= 0.0 || candidate.entry_zone_high <= 0.0) {
    candidate.entry_zone_low = candidate.entry_price;
    candidate.entry_zone_high = candidate.entry_price;
  }
  if (candidate.atr_at_entry <= 0.0) {
    candidate.atr_at_entry = context.atr;
  }
  return candidate;
}

}  // namespace tactical
