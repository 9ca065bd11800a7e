#pragma once

#include <cstdint>

#include "invoicer/decimal.hpp"
#include "invoicer/types.hpp"

namespace invoicer {

struct PricingSchedule {
  std::int32_t api_tier_threshold = 0;  // calls billed at tier 1 rate
  Decimal api_rate_tier1;               // per call, up to the threshold
  Decimal api_rate_tier2;               // per call, above the threshold
  Decimal storage_rate_per_gb;
  Decimal compute_rate_per_minute;

  // 10000 calls; 0.01 / 0.008 per call; 0.25 per GB; 0.05 per minute
  static PricingSchedule standard();
};

class InvoiceCalculator {
public:
  explicit InvoiceCalculator(const PricingSchedule& pricing = PricingSchedule::standard());

  // Negative quantities are not rejected here; they produce negative costs.
  Invoice calculate(const UsageRecord& r) const;

  const PricingSchedule& pricing() const { return pricing_; }

private:
  PricingSchedule pricing_;
};

} // namespace invoicer
