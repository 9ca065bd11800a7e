#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace invoicer {

// Parsed usage input. Floating-point numbers that are direct members of the
// root array's objects also keep their source text, so decimal fields can be
// read digit for digit instead of through double.
struct UsageDocument {
  nlohmann::json root;
  std::map<std::pair<std::size_t, std::string>, std::string> raw_numbers; // (element, key) -> token

  // nullptr unless that member was written as a floating-point number
  const std::string* raw_number(std::size_t element, const std::string& key) const;
};

// SAX handler that builds the same DOM as nlohmann::json::parse and records
// raw float tokens into a UsageDocument.
class UsageSaxBuilder : public nlohmann::json_sax<nlohmann::json> {
public:
  explicit UsageSaxBuilder(UsageDocument& doc) : doc_(doc) {}

  bool null() override;
  bool boolean(bool val) override;
  bool number_integer(number_integer_t val) override;
  bool number_unsigned(number_unsigned_t val) override;
  bool number_float(number_float_t val, const string_t& s) override;
  bool string(string_t& val) override;
  bool binary(binary_t& val) override;
  bool start_object(std::size_t elements) override;
  bool key(string_t& val) override;
  bool end_object() override;
  bool start_array(std::size_t elements) override;
  bool end_array() override;
  bool parse_error(std::size_t position,
                   const std::string& last_token,
                   const nlohmann::json::exception& ex) override;

  const std::string& error() const { return error_; }

private:
  nlohmann::json* add_value(nlohmann::json&& v);

  UsageDocument& doc_;
  std::vector<nlohmann::json*> stack_;
  nlohmann::json* member_ = nullptr;
  std::string key_;
  std::string error_;
};

// On false, *error_out holds "Invalid JSON: <parser message>".
bool read_usage_document(const std::string& text,
                         UsageDocument& out,
                         std::string* error_out = nullptr);

} // namespace invoicer
