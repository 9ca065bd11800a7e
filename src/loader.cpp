#include "invoicer/loader.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "invoicer/coerce.hpp"
#include "invoicer/json_reader.hpp"

namespace invoicer {

static const char* const kUnknownCustomer = "UNKNOWN";

// Decodes one UTF-8 sequence at s[i]; false on malformed input.
static bool next_code_point(const std::string& s, std::size_t& i, std::uint32_t& cp) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  std::size_t len = 0;
  if (b0 < 0x80) {
    cp = b0;
    len = 1;
  } else if ((b0 & 0xE0) == 0xC0) {
    cp = b0 & 0x1F;
    len = 2;
  } else if ((b0 & 0xF0) == 0xE0) {
    cp = b0 & 0x0F;
    len = 3;
  } else if ((b0 & 0xF8) == 0xF0) {
    cp = b0 & 0x07;
    len = 4;
  } else {
    return false;
  }
  if (i + len > s.size()) return false;
  for (std::size_t k = 1; k < len; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if ((b & 0xC0) != 0x80) return false;
    cp = (cp << 6) | (b & 0x3F);
  }
  i += len;
  return true;
}

// Unicode White_Space, plus the C0 separators 0x1C-0x1F.
static bool is_unicode_space(std::uint32_t cp) {
  if (cp >= 0x09 && cp <= 0x0D) return true;
  if (cp >= 0x1C && cp <= 0x20) return true;
  if (cp >= 0x2000 && cp <= 0x200A) return true;
  switch (cp) {
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return false;
  }
}

static bool is_blank(const std::string& s) {
  std::size_t i = 0;
  while (i < s.size()) {
    std::uint32_t cp = 0;
    if (!next_code_point(s, i, cp) || !is_unicode_space(cp)) return false;
  }
  return true;
}

// Checks CustomerId, API_Calls, Storage_GB, Compute_Minutes in that order and
// stops at the first failure. `customer_out` is only replaced once the id is
// known to be usable.
static bool validate_entry(const UsageDocument& doc,
                           std::size_t index,
                           UsageRecord& out,
                           std::string& customer_out,
                           std::string& cause_out) {
  const nlohmann::json& entry = doc.root[index];

  auto id_it = entry.find("CustomerId");
  std::string id;
  if (id_it == entry.end() || !coerce_text(*id_it, id, doc.raw_number(index, "CustomerId"))) {
    cause_out = "Missing CustomerId";
    return false;
  }
  if (is_blank(id)) {
    cause_out = "Empty CustomerId";
    return false;
  }
  customer_out = id;

  auto api_it = entry.find("API_Calls");
  std::int32_t api_calls = 0;
  if (api_it == entry.end() ||
      !coerce_int32(*api_it, api_calls, doc.raw_number(index, "API_Calls"))) {
    cause_out = "Invalid API_Calls";
    return false;
  }

  auto storage_it = entry.find("Storage_GB");
  Decimal storage_gb;
  if (storage_it == entry.end() ||
      !coerce_decimal(*storage_it, storage_gb, doc.raw_number(index, "Storage_GB"))) {
    cause_out = "Invalid Storage_GB";
    return false;
  }

  auto compute_it = entry.find("Compute_Minutes");
  std::int32_t compute_minutes = 0;
  if (compute_it == entry.end() ||
      !coerce_int32(*compute_it, compute_minutes, doc.raw_number(index, "Compute_Minutes"))) {
    cause_out = "Invalid Compute_Minutes";
    return false;
  }

  out.customer_id = id;
  out.api_calls = api_calls;
  out.storage_gb = storage_gb;
  out.compute_minutes = compute_minutes;
  return true;
}

std::string Rejection::message() const {
  if (kind == RejectKind::not_an_object) return "Entry is not an object";
  return "Missing or invalid fields for CustomerId: " + customer_id + " (" + cause + ")";
}

bool load_usage_json(const std::string& text,
                     LoadResult& out,
                     std::string* error_out) {
  out = LoadResult{};

  UsageDocument doc;
  if (!read_usage_document(text, doc, error_out)) return false;

  const nlohmann::json& root = doc.root;
  if (!root.is_array()) {
    if (error_out) *error_out = "Root JSON is not an array";
    return false;
  }

  for (std::size_t i = 0; i < root.size(); ++i) {
    const nlohmann::json& entry = root[i];

    Rejection rej;
    rej.index = i;
    rej.customer_id = kUnknownCustomer;

    if (!entry.is_object()) {
      rej.kind = RejectKind::not_an_object;
      rej.cause = "Entry is not an object";
      out.rejected.push_back(rej);
      continue;
    }

    UsageRecord r;
    if (!validate_entry(doc, i, r, rej.customer_id, rej.cause)) {
      rej.kind = RejectKind::invalid_fields;
      out.rejected.push_back(rej);
      continue;
    }

    out.valid.push_back(r);
  }

  return true;
}

bool load_usage_file(const std::string& path,
                     LoadResult& out,
                     std::string* error_out) {
  out = LoadResult{};

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (error_out) *error_out = "Input file not found: " + path;
    return false;
  }
  if (std::filesystem::is_directory(path, ec)) {
    if (error_out) *error_out = "Failed to read file: " + path + " (is a directory)";
    return false;
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    if (error_out) *error_out = "Failed to open file: " + path;
    return false;
  }

  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad()) {
    if (error_out) *error_out = "Failed to read file: " + path;
    return false;
  }

  return load_usage_json(buf.str(), out, error_out);
}

} // namespace invoicer
