#include "tactical/monitor/position_math.hpp"

#include <cmath>

namespace tactical {

double PositionMath::pnl(domain::Direction direction, double entry,
                         double price, double size, double leverage) {
  return (price - entry) * size * leverage * domain::directionSign(direction);
}

double PositionMath::margin(double entry, double size, double leverage) {
  if (leverage <= 0.0) {
    return 0.0;
  }
  return entry * size / leverage;
}

double PositionMath::pnlPct(double pnl, double margin) {
  if (margin <= 0.0) {
    return 0.0;
  }
  return pnl / margin * 100.0;
}

double PositionMath::liquidationPrice(domain::Direction direction,
                                      double entry, double leverage,
                                      double buffer) {
  if (leverage <= 0.0) {
    return 0.0;
  }
  const double move = buffer / leverage;
  return direction == domain::Direction::Long ? entry * (1.0 - move)
                                              : entry * (1.0 + move);
}

double PositionMath::positionSize(double balance, double risk_pct,
                                  double entry, double stop,
                                  double leverage) {
  const double stop_distance = std::abs(entry - stop);
  if (balance <= 0.0 || stop_distance <= 0.0 || leverage <= 0.0) {
    return 0.0;
  }
  return balance * (risk_pct / 100.0) / (stop_distance * leverage);
}

double PositionMath::favorableMovePct(domain::Direction direction,
                                      double entry, double price) {
  if (entry <= 0.0) {
    return 0.0;
  }
  return (price - entry) / entry * 100.0 * domain::directionSign(direction);
}

bool PositionMath::liquidationCrossed(const domain::Position& position,
                                      double price) {
  if (position.liquidation_price <= 0.0) {
    return false;
  }
  return position.direction == domain::Direction::Long
             ? price <= position.liquidation_price
             : price >= position.liquidation_price;
}

bool PositionMath::stopCrossed(const domain::Position& position,
                               double price) {
  if (position.stop_loss <= 0.0) {
    return false;
  }
  return position.direction == domain::Direction::Long
             ? price <= position.stop_loss
             : price >= position.stop_loss;
}

std::optional<domain::CloseReason> PositionMath::checkClose(
    const domain::Position& position, double price) {
  if (liquidationCrossed(position, price)) {
    return domain::CloseReason::Liquidated;
  }
  if (stopCrossed(position, price)) {
    return domain::CloseReason::StopLoss;
  }
  if (position.targets.empty() && position.take_profit > 0.0) {
    const bool hit = position.direction == domain::Direction::Long
                         ? price >= position.take_profit
                         : price <= position.take_profit;
    if (hit) {
      return domain::CloseReason::TakeProfit;
    }
  }
  return std::nullopt;
}

}  // namespace tactical
