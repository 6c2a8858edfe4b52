#include "tactical/validation/advisory_signal.hpp"
#include "tactical/domain/enum_strings.hpp"
#include "tactical/validation/price_parser.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>

namespace tactical {

namespace {

std::optional<double> priceField(const nlohmann::json& value) {
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_string()) {
    return PriceParser::parse(value.get<std::string>());
  }
  return std::nullopt;
}

std::optional<double> priceAt(const nlohmann::json& payload, const char* key) {
  const auto it = payload.find(key);
  if (it == payload.end()) {
    return std::nullopt;
  }
  return priceField(*it);
}

}  // namespace

std::vector<double> allocateTargetPcts(std::size_t target_count,
                                       const domain::TacticalConfig& config) {
  if (target_count == config.target_position_pcts.size()) {
    return config.target_position_pcts;
  }
  std::vector<double> pcts;
  if (target_count == 0) {
    return pcts;
  }
  const double each = std::floor(100.0 / target_count);
  pcts.assign(target_count, each);
  pcts.back() = 100.0 - each * (target_count - 1);
  return pcts;
}

ParsedAdvisorySignal parseAdvisorySignal(const nlohmann::json& payload,
                                         const ValidationContext& context,
                                         const domain::TacticalConfig& config) {
  if (!payload.is_object()) {
    return InvalidAdvisorySignal{"Advisory payload is not an object"};
  }

  domain::EnhancedTradeSignal candidate;
  try {
    candidate.id = payload.value("id", std::string{});
    candidate.symbol = payload.value("symbol", std::string{"BTCUSDT"});

    std::string side = payload.value("type", std::string{});
    if (side.empty()) {
      side = payload.value("direction", std::string{});
    }
    const auto direction = domain::parseDirection(side);
    if (!direction) {
      return InvalidAdvisorySignal{"Unknown direction '" + side + "'"};
    }
    candidate.direction = *direction;

    const auto entry = priceAt(payload, "entryZone");
    const auto stop = priceAt(payload, "invalidation");
    if (!entry || !stop) {
      return InvalidAdvisorySignal{"Entry or invalidation failed to parse"};
    }
    candidate.entry_price = *entry;
    candidate.stop_loss = *stop;

    const auto targets = payload.find("targets");
    if (targets == payload.end() || !targets->is_array() || targets->empty()) {
      return InvalidAdvisorySignal{"No targets"};
    }
    const auto pcts = allocateTargetPcts(targets->size(), config);
    const double risk = std::abs(candidate.entry_price - candidate.stop_loss);
    for (std::size_t i = 0; i < targets->size(); ++i) {
      const auto price = priceField((*targets)[i]);
      if (!price) {
        return InvalidAdvisorySignal{"Target failed to parse"};
      }
      domain::TargetLevel level;
      level.price = *price;
      level.r_multiple =
          risk > 0.0 ? std::abs(*price - candidate.entry_price) / risk : 0.0;
      level.position_pct = pcts[i];
      candidate.targets.push_back(level);
    }

    const double confidence = payload.value("confidence", 50.0);
    candidate.confidence =
        std::clamp(std::isfinite(confidence) ? confidence : 50.0, 0.0, 100.0);
    candidate.decayed_confidence = candidate.confidence;

    const std::string reasoning = payload.value("reasoning", std::string{});
    if (!reasoning.empty()) {
      candidate.reasoning.push_back(reasoning);
    }

    const auto source =
        domain::parseSignalSource(payload.value("source", std::string{"ai"}));
    candidate.source = source && *source == domain::SignalSource::Hybrid
                           ? domain::SignalSource::Hybrid
                           : domain::SignalSource::Ai;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[AdvisorySignal] Malformed field: " << e.what() << "\n";
    return InvalidAdvisorySignal{std::string("Malformed field: ") + e.what()};
  }

  candidate.approval_status = domain::ApprovalStatus::PendingReview;
  candidate.status = domain::SignalStatus::Active;
  candidate.created_at_ms = context.now_ms;
  if (candidate.id.empty()) {
    candidate.id = "advisory-" + std::to_string(context.now_ms);
  }

  auto result = SignalValidator::validate(std::move(candidate), context, config);
  if (auto* rejection = std::get_if<domain::Rejection>(&result)) {
    return InvalidAdvisorySignal{rejection->reason};
  }
  return ValidAdvisorySignal{std::get<domain::EnhancedTradeSignal>(
      std::move(result))};
}

}  // namespace tactical
