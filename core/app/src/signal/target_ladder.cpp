#include "tactical/signal/target_ladder.hpp"

#include <algorithm>
#include <cmath>

namespace tactical {

namespace {

constexpr double kSnapTolerance = 0.01;

}  // namespace

bool TargetLadder::crossed(domain::Direction direction, double price,
                           double level) {
  return direction == domain::Direction::Long ? price >= level
                                              : price <= level;
}

// -----------------------------------------------------------------------------
// build
// -----------------------------------------------------------------------------
std::vector<domain::TargetLevel> TargetLadder::build(
    domain::Direction direction, double entry, double stop,
    const domain::MarketStructure& structure,
    const domain::TacticalConfig& config) {
  const bool is_long = direction == domain::Direction::Long;
  const double risk = std::abs(entry - stop);
  const std::size_t n = std::min(config.target_r_multiples.size(),
                                 config.target_position_pcts.size());

  std::vector<domain::TargetLevel> targets;
  targets.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    domain::TargetLevel t;
    t.r_multiple = config.target_r_multiples[i];
    t.position_pct = config.target_position_pcts[i];
    t.price = is_long ? entry + risk * t.r_multiple
                      : entry - risk * t.r_multiple;
    targets.push_back(t);
  }

  if (!config.use_structure_levels || structure.levels.empty()) {
    return targets;
  }

  for (std::size_t i = 0; i < targets.size(); ++i) {
    auto& t = targets[i];
    const domain::StructureLevel* strongest = nullptr;
    for (const auto& level : structure.levels) {
      const double distance = std::abs(level.price - t.price) / t.price;
      if (distance >= config.sr_snap_proximity_pct / 100.0) {
        continue;
      }
      if (strongest == nullptr || level.strength > strongest->strength) {
        strongest = &level;
      }
    }
    if (strongest == nullptr) {
      continue;
    }

    const bool improves =
        is_long ? strongest->price > t.price * (1.0 - kSnapTolerance)
                : strongest->price < t.price * (1.0 + kSnapTolerance);
    const double prev = i == 0 ? entry : targets[i - 1].price;
    const bool after_prev =
        is_long ? strongest->price > prev : strongest->price < prev;
    bool before_next = true;
    if (i + 1 < targets.size()) {
      const double next = targets[i + 1].price;
      before_next = is_long ? strongest->price < next : strongest->price > next;
    }
    if (improves && after_prev && before_next) {
      t.price = strongest->price;
    }
  }
  return targets;
}

// -----------------------------------------------------------------------------
// applyPrice
// -----------------------------------------------------------------------------
LadderUpdate TargetLadder::applyPrice(std::vector<domain::TargetLevel>& targets,
                                      domain::Direction direction,
                                      double price, std::int64_t now_ms,
                                      int break_even_tier) {
  LadderUpdate update;
  bool hit_taken = false;

  for (std::size_t i = 0; i < targets.size(); ++i) {
    auto& t = targets[i];
    if (t.status != domain::TargetStatus::Pending) {
      continue;
    }
    if (!crossed(direction, price, t.price)) {
      // Tiers are ordered: nothing further out can be crossed either.
      break;
    }

    TierFill fill;
    fill.index = i;
    fill.fraction = t.position_pct / 100.0;
    if (!hit_taken) {
      t.status = domain::TargetStatus::Hit;
      t.fill_price = t.price;
      hit_taken = true;
    } else {
      t.status = domain::TargetStatus::Missed;
      t.fill_price = price;
    }
    t.filled_at_ms = now_ms;
    fill.status = t.status;
    fill.fill_price = t.fill_price;

    update.released_fraction += fill.fraction;
    if (static_cast<int>(i) + 1 == break_even_tier) {
      update.break_even_triggered = true;
    }
    update.fills.push_back(fill);
  }
  return update;
}

void TargetLadder::cancelPending(std::vector<domain::TargetLevel>& targets) {
  for (auto& t : targets) {
    if (t.status == domain::TargetStatus::Pending) {
      t.status = domain::TargetStatus::Cancelled;
    }
  }
}

double TargetLadder::allocationPct(
    const std::vector<domain::TargetLevel>& targets) {
  double sum = 0.0;
  for (const auto& t : targets) {
    sum += t.position_pct;
  }
  return sum;
}

bool TargetLadder::allReleased(
    const std::vector<domain::TargetLevel>& targets) {
  return std::none_of(targets.begin(), targets.end(), [](const auto& t) {
    return t.status == domain::TargetStatus::Pending;
  });
}

}  // namespace tactical
