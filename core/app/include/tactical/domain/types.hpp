#pragma once

namespace tactical {
namespace domain {

// -----------------------------------------------------------------------------
// Shared enumerations for the tactical signal and risk domain
// -----------------------------------------------------------------------------
//
// @brief  Scoped enums used by more than one domain struct. Keeping them in
//         one header avoids include cycles between market structure, signal,
//         pattern and position headers.
//
// @details
// String conversions (for logging, telemetry and JSON persistence) live in
// tactical/domain/enum_strings.hpp. Every enum here has a stable string
// form; persisted state depends on those strings, so enumerator names may be
// extended but never renamed.
//
// Thread model:
//   Plain enums. Value types, safe to copy and compare from any thread.
// -----------------------------------------------------------------------------

/// Trade direction of a signal or position.
enum class Direction {
  Long,
  Short,
};

/// Directional lean of a scorer or a consensus vote.
enum class Bias {
  Bullish,
  Bearish,
  Neutral,
};

// -----------------------------------------------------------------------------
// Regime — discrete volatility/trend classification
// -----------------------------------------------------------------------------
// RegimeClassifier yields LowVol / Normal / HighVol / Trending.
// StructureAnalyzer refines LowVol into Contraction and volatile non-trending
// markets into Expansion. Adaptive thresholds are selected per regime bucket
// (see domain::TacticalConfig::thresholdsFor).
// -----------------------------------------------------------------------------
enum class Regime {
  LowVol,
  Normal,
  HighVol,
  Expansion,
  Contraction,
  Trending,
};

enum class TrendType {
  StrongTrend,
  WeakTrend,
  Ranging,
  Breakout,
};

enum class TrendDirection {
  Up,
  Down,
  Neutral,
};

/// Qualitative shape of the setup that produced a signal.
enum class SignalType {
  TrendContinuation,
  Crossover,
  Pullback,
  Reversal,
};

enum class CvdTrend {
  Bullish,
  Bearish,
  Neutral,
};

enum class CvdDivergence {
  None,
  Bullish,
  Bearish,
};

enum class AbsorptionSide {
  None,
  Buy,
  Sell,
};

enum class LiquidationCascade {
  None,
  LongLiquidations,   // Longs being flushed: bearish pressure
  ShortLiquidations,  // Shorts being squeezed: bullish pressure
};

/// Why a position (or a simulated trade) was closed.
enum class CloseReason {
  Liquidated,
  StopLoss,
  TakeProfit,
  Manual,
  EndOfData,
};

/// Instrument class; session/weekend penalties only apply to non-crypto.
enum class AssetType {
  Crypto,
  Forex,
  Equity,
};

/// Returns +1 for Long and -1 for Short.
inline double directionSign(Direction d) {
  return d == Direction::Long ? 1.0 : -1.0;
}

inline Bias toBias(Direction d) {
  return d == Direction::Long ? Bias::Bullish : Bias::Bearish;
}

}  // namespace domain
}  // namespace tactical
