#pragma once

#include <cstdint>
#include <string>

#include "invoicer/decimal.hpp"

namespace invoicer {

// One customer's usage for a billing period (one element of the input array)
struct UsageRecord {
  std::string customer_id;
  std::int32_t api_calls = 0;
  Decimal storage_gb;
  std::int32_t compute_minutes = 0;
};

struct Invoice {
  std::string customer_id;
  Decimal api_cost;
  Decimal storage_cost;
  Decimal compute_cost;

  Decimal total() const { return api_cost + storage_cost + compute_cost; }
};

} // namespace invoicer
