#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "invoicer/types.hpp"

namespace invoicer {

enum class RejectKind {
  not_an_object,
  invalid_fields,
};

// One input element that did not become a UsageRecord
struct Rejection {
  std::size_t index = 0;    // position in the input array
  RejectKind kind = RejectKind::invalid_fields;
  std::string customer_id;  // "UNKNOWN" until CustomerId has been validated
  std::string cause;        // e.g. "Invalid API_Calls"

  std::string message() const;
};

struct LoadResult {
  std::vector<UsageRecord> valid;
  std::vector<Rejection> rejected;
};

// On false, `out` is left empty and *error_out describes the batch-level
// failure. Element-level failures never make these return false.
bool load_usage_json(const std::string& text,
                     LoadResult& out,
                     std::string* error_out = nullptr);

bool load_usage_file(const std::string& path,
                     LoadResult& out,
                     std::string* error_out = nullptr);

} // namespace invoicer
