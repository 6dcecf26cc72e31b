#include "paneguard/security/risk.hpp"

#include "paneguard/common/fs.hpp"

namespace paneguard::security {

std::string risk_tier_to_string(const RiskTier tier) {
  switch (tier) {
  case RiskTier::Low:
    return "low";
  case RiskTier::Medium:
    return "medium";
  case RiskTier::High:
    return "high";
  case RiskTier::Critical:
    return "critical";
  }
  return "critical";
}

common::Result<RiskTier> risk_tier_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "low") {
    return common::Result<RiskTier>::success(RiskTier::Low);
  }
  if (normalized == "medium") {
    return common::Result<RiskTier>::success(RiskTier::Medium);
  }
  if (normalized == "high") {
    return common::Result<RiskTier>::success(RiskTier::High);
  }
  if (normalized == "critical") {
    return common::Result<RiskTier>::success(RiskTier::Critical);
  }
  return common::Result<RiskTier>::failure("Invalid risk tier: " + value);
}

int risk_score(const RiskTier tier) {
  switch (tier) {
  case RiskTier::Low:
    return 2;
  case RiskTier::Medium:
    return 5;
  case RiskTier::High:
    return 7;
  case RiskTier::Critical:
    return 10;
  }
  return 10;
}

} // namespace paneguard::security
