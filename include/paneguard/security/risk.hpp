#pragma once

#include "paneguard/common/result.hpp"

#include <cstdint>
#include <string>

namespace paneguard::security {

enum class RiskTier : std::uint8_t { Low, Medium, High, Critical };

[[nodiscard]] std::string risk_tier_to_string(RiskTier tier);
[[nodiscard]] common::Result<RiskTier> risk_tier_from_string(const std::string &value);

[[nodiscard]] constexpr RiskTier max_tier(const RiskTier a, const RiskTier b) {
  return static_cast<std::uint8_t>(a) >= static_cast<std::uint8_t>(b) ? a : b;
}

/// 1-10 score attached to audit events raised for a finding of this tier.
[[nodiscard]] int risk_score(RiskTier tier);

} // namespace paneguard::security
