#include "invoicer/calculator.hpp"

#include <algorithm>

namespace invoicer {

PricingSchedule PricingSchedule::standard() {
  PricingSchedule p;
  p.api_tier_threshold = 10000;
  p.api_rate_tier1 = Decimal::from_units(1, 2);
  p.api_rate_tier2 = Decimal::from_units(8, 3);
  p.storage_rate_per_gb = Decimal::from_units(25, 2);
  p.compute_rate_per_minute = Decimal::from_units(5, 2);
  return p;
}

InvoiceCalculator::InvoiceCalculator(const PricingSchedule& pricing)
    : pricing_(pricing) {}

Invoice InvoiceCalculator::calculate(const UsageRecord& r) const {
  const std::int64_t calls = r.api_calls;
  const std::int64_t threshold = pricing_.api_tier_threshold;

  const std::int64_t tier1_units = std::min(calls, threshold);
  const std::int64_t tier2_units = std::max<std::int64_t>(calls - threshold, 0);

  Invoice inv;
  inv.customer_id = r.customer_id;
  inv.api_cost = Decimal::from_int(tier1_units) * pricing_.api_rate_tier1 +
                 Decimal::from_int(tier2_units) * pricing_.api_rate_tier2;
  inv.storage_cost = r.storage_gb * pricing_.storage_rate_per_gb;
  inv.compute_cost = Decimal::from_int(r.compute_minutes) * pricing_.compute_rate_per_minute;
  return inv;
}

} // namespace invoicer
