#pragma once

#include <iosfwd>
#include <vector>

#include "invoicer/loader.hpp"
#include "invoicer/types.hpp"

namespace invoicer {

constexpr const char* kVersion = "1.0";

struct BilledRecord {
  UsageRecord usage;
  Invoice invoice;
};

// One invoice block per billed record, then one "Skipped invalid entry" line
// per rejection. Money is printed with 2 decimals, usage verbatim.
void write_text_report(std::ostream& os,
                       const std::vector<BilledRecord>& billed,
                       const std::vector<Rejection>& rejected);

void write_json_report(std::ostream& os,
                       const std::vector<BilledRecord>& billed,
                       const std::vector<Rejection>& rejected);

} // namespace invoicer
