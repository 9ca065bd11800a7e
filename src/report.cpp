#include "invoicer/report.hpp"

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace invoicer {

static const std::string kRule(29, '-');

static std::string money(const Decimal& d) {
  return d.to_fixed(2);
}

void write_text_report(std::ostream& os,
                       const std::vector<BilledRecord>& billed,
                       const std::vector<Rejection>& rejected) {
  for (const auto& b : billed) {
    const UsageRecord& u = b.usage;
    const Invoice& inv = b.invoice;

    os << "Invoice for Customer: " << inv.customer_id << "\n"
       << kRule << "\n"
       << "API Calls: " << u.api_calls << " calls -> $" << money(inv.api_cost) << "\n"
       << "Storage: " << u.storage_gb << " GB -> $" << money(inv.storage_cost) << "\n"
       << "Compute Time: " << u.compute_minutes << " minutes -> $" << money(inv.compute_cost) << "\n"
       << kRule << "\n"
       << "Total Due: $" << money(inv.total()) << "\n\n";
  }

  for (const auto& r : rejected) {
    os << "Skipped invalid entry: " << r.message() << "\n";
  }
}

void write_json_report(std::ostream& os,
                       const std::vector<BilledRecord>& billed,
                       const std::vector<Rejection>& rejected) {
  nlohmann::ordered_json doc;
  doc["version"] = kVersion;

  // Amounts are strings so they keep their exact decimal digits.
  nlohmann::ordered_json invoices = nlohmann::ordered_json::array();
  for (const auto& b : billed) {
    nlohmann::ordered_json usage;
    usage["api_calls"] = b.usage.api_calls;
    usage["storage_gb"] = b.usage.storage_gb.to_string();
    usage["compute_minutes"] = b.usage.compute_minutes;

    nlohmann::ordered_json costs;
    costs["api"] = money(b.invoice.api_cost);
    costs["storage"] = money(b.invoice.storage_cost);
    costs["compute"] = money(b.invoice.compute_cost);

    nlohmann::ordered_json entry;
    entry["customer_id"] = b.invoice.customer_id;
    entry["usage"] = usage;
    entry["costs"] = costs;
    entry["total"] = money(b.invoice.total());
    invoices.push_back(entry);
  }
  doc["invoices"] = invoices;

  nlohmann::ordered_json skipped = nlohmann::ordered_json::array();
  for (const auto& r : rejected) {
    nlohmann::ordered_json entry;
    entry["index"] = r.index;
    entry["customer_id"] = r.customer_id;
    entry["cause"] = r.cause;
    entry["message"] = r.message();
    skipped.push_back(entry);
  }
  doc["rejected"] = skipped;

  os << doc.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << "\n";
}

} // namespace invoicer
