#include "tactical/domain/enum_strings.hpp"

#include <initializer_list>

namespace tactical {
namespace domain {

namespace {

// Linear lookup over the enumerators of E. The enums are tiny, so a table
// scan is simpler than maintaining a second map per type.
template <typename E>
std::optional<E> parseEnum(const std::string& s, std::initializer_list<E> all) {
  for (E v : all) {
    if (s == toString(v)) {
      return v;
    }
  }
  return std::nullopt;
}

}  // namespace

const char* toString(Direction v) {
  switch (v) {
    case Direction::Long:  return "LONG";
    case Direction::Short: return "SHORT";
  }
  return "UNKNOWN";
}

const char* toString(Bias v) {
  switch (v) {
    case Bias::Bullish: return "BULLISH";
    case Bias::Bearish: return "BEARISH";
    case Bias::Neutral: return "NEUTRAL";
  }
  return "UNKNOWN";
}

const char* toString(Regime v) {
  switch (v) {
    case Regime::LowVol:      return "LOW_VOL";
    case Regime::Normal:      return "NORMAL";
    case Regime::HighVol:     return "HIGH_VOL";
    case Regime::Expansion:   return "EXPANSION";
    case Regime::Contraction: return "CONTRACTION";
    case Regime::Trending:    return "TRENDING";
  }
  return "UNKNOWN";
}

const char* toString(TrendType v) {
  switch (v) {
    case TrendType::StrongTrend: return "STRONG_TREND";
    case TrendType::WeakTrend:   return "WEAK_TREND";
    case TrendType::Ranging:     return "RANGING";
    case TrendType::Breakout:    return "BREAKOUT";
  }
  return "UNKNOWN";
}

const char* toString(TrendDirection v) {
  switch (v) {
    case TrendDirection::Up:      return "UP";
    case TrendDirection::Down:    return "DOWN";
    case TrendDirection::Neutral: return "NEUTRAL";
  }
  return "UNKNOWN";
}

const char* toString(SignalType v) {
  switch (v) {
    case SignalType::TrendContinuation: return "TREND_CONTINUATION";
    case SignalType::Crossover:         return "CROSSOVER";
    case SignalType::Pullback:          return "PULLBACK";
    case SignalType::Reversal:          return "REVERSAL";
  }
  return "UNKNOWN";
}

const char* toString(CvdTrend v) {
  switch (v) {
    case CvdTrend::Bullish: return "BULLISH";
    case CvdTrend::Bearish: return "BEARISH";
    case CvdTrend::Neutral: return "NEUTRAL";
  }
  return "UNKNOWN";
}

const char* toString(CvdDivergence v) {
  switch (v) {
    case CvdDivergence::None:    return "NONE";
    case CvdDivergence::Bullish: return "BULLISH_DIV";
    case CvdDivergence::Bearish: return "BEARISH_DIV";
  }
  return "UNKNOWN";
}

const char* toString(AbsorptionSide v) {
  switch (v) {
    case AbsorptionSide::None: return "NONE";
    case AbsorptionSide::Buy:  return "BUY";
    case AbsorptionSide::Sell: return "SELL";
  }
  return "UNKNOWN";
}

const char* toString(LiquidationCascade v) {
  switch (v) {
    case LiquidationCascade::None:              return "NONE";
    case LiquidationCascade::LongLiquidations:  return "LONG_LIQS";
    case LiquidationCascade::ShortLiquidations: return "SHORT_LIQS";
  }
  return "UNKNOWN";
}

const char* toString(CloseReason v) {
  switch (v) {
    case CloseReason::Liquidated: return "LIQUIDATED";
    case CloseReason::StopLoss:   return "STOP_LOSS";
    case CloseReason::TakeProfit: return "TAKE_PROFIT";
    case CloseReason::Manual:     return "MANUAL";
    case CloseReason::EndOfData:  return "END_OF_DATA";
  }
  return "UNKNOWN";
}

const char* toString(AssetType v) {
  switch (v) {
    case AssetType::Crypto: return "CRYPTO";
    case AssetType::Forex:  return "FOREX";
    case AssetType::Equity: return "EQUITY";
  }
  return "UNKNOWN";
}

const char* toString(LevelType v) {
  return v == LevelType::Support ? "SUPPORT" : "RESISTANCE";
}

const char* toString(LevelSource v) {
  return v == LevelSource::Swing ? "SWING" : "ROUND_NUMBER";
}

const char* toString(TargetStatus v) {
  switch (v) {
    case TargetStatus::Pending:   return "PENDING";
    case TargetStatus::Hit:       return "HIT";
    case TargetStatus::Missed:    return "MISSED";
    case TargetStatus::Cancelled: return "CANCELLED";
  }
  return "UNKNOWN";
}

const char* toString(SignalStatus v) {
  switch (v) {
    case SignalStatus::Scanning:    return "SCANNING";
    case SignalStatus::Active:      return "ACTIVE";
    case SignalStatus::Filled:      return "FILLED";
    case SignalStatus::Completed:   return "COMPLETED";
    case SignalStatus::Stopped:     return "STOPPED";
    case SignalStatus::Closed:      return "CLOSED";
    case SignalStatus::Invalidated: return "INVALIDATED";
    case SignalStatus::Expired:     return "EXPIRED";
  }
  return "UNKNOWN";
}

const char* toString(SignalSource v) {
  switch (v) {
    case SignalSource::Tactical: return "tactical";
    case SignalSource::Ai:       return "ai";
    case SignalSource::Hybrid:   return "hybrid";
  }
  return "unknown";
}

const char* toString(ApprovalStatus v) {
  return v == ApprovalStatus::Active ? "active" : "pending_review";
}

const char* toString(PositionState v) {
  switch (v) {
    case PositionState::Open:    return "OPEN";
    case PositionState::Closing: return "CLOSING";
    case PositionState::Closed:  return "CLOSED";
  }
  return "UNKNOWN";
}

const char* toString(TradeResult v) {
  switch (v) {
    case TradeResult::Win:       return "WIN";
    case TradeResult::Loss:      return "LOSS";
    case TradeResult::BreakEven: return "BE";
  }
  return "UNKNOWN";
}

std::optional<Direction> parseDirection(const std::string& s) {
  return parseEnum(s, {Direction::Long, Direction::Short});
}

std::optional<Regime> parseRegime(const std::string& s) {
  return parseEnum(s, {Regime::LowVol, Regime::Normal, Regime::HighVol,
                       Regime::Expansion, Regime::Contraction,
                       Regime::Trending});
}

std::optional<TrendType> parseTrendType(const std::string& s) {
  return parseEnum(s, {TrendType::StrongTrend, TrendType::WeakTrend,
                       TrendType::Ranging, TrendType::Breakout});
}

std::optional<TrendDirection> parseTrendDirection(const std::string& s) {
  return parseEnum(s, {TrendDirection::Up, TrendDirection::Down,
                       TrendDirection::Neutral});
}

std::optional<SignalType> parseSignalType(const std::string& s) {
  return parseEnum(s, {SignalType::TrendContinuation, SignalType::Crossover,
                       SignalType::Pullback, SignalType::Reversal});
}

std::optional<CvdTrend> parseCvdTrend(const std::string& s) {
  return parseEnum(s, {CvdTrend::Bullish, CvdTrend::Bearish,
                       CvdTrend::Neutral});
}

std::optional<CvdDivergence> parseCvdDivergence(const std::string& s) {
  return parseEnum(s, {CvdDivergence::None, CvdDivergence::Bullish,
                       CvdDivergence::Bearish});
}

std::optional<CloseReason> parseCloseReason(const std::string& s) {
  return parseEnum(s, {CloseReason::Liquidated, CloseReason::StopLoss,
                       CloseReason::TakeProfit, CloseReason::Manual,
                       CloseReason::EndOfData});
}

std::optional<AssetType> parseAssetType(const std::string& s) {
  return parseEnum(s, {AssetType::Crypto, AssetType::Forex,
                       AssetType::Equity});
}

std::optional<Bias> parseBias(const std::string& s) {
  return parseEnum(s, {Bias::Bullish, Bias::Bearish, Bias::Neutral});
}

std::optional<SignalSource> parseSignalSource(const std::string& s) {
  return parseEnum(s, {SignalSource::Tactical, SignalSource::Ai,
                       SignalSource::Hybrid});
}

}  // namespace domain
}  // namespace tactical
