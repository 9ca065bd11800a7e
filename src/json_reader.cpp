#include "invoicer/json_reader.hpp"

namespace invoicer {

const std::string* UsageDocument::raw_number(std::size_t element, const std::string& key) const {
  auto it = raw_numbers.find({element, key});
  if (it == raw_numbers.end()) return nullptr;
  return &it->second;
}

// True while the builder sits directly inside one of the root array's objects.
static bool in_top_level_entry(const std::vector<nlohmann::json*>& stack) {
  return stack.size() == 2 && stack[0]->is_array() && stack[1]->is_object();
}

nlohmann::json* UsageSaxBuilder::add_value(nlohmann::json&& v) {
  if (stack_.empty()) {
    doc_.root = std::move(v);
    return &doc_.root;
  }

  nlohmann::json& parent = *stack_.back();
  if (parent.is_array()) {
    parent.push_back(std::move(v));
    return &parent.back();
  }

  *member_ = std::move(v);
  return member_;
}

bool UsageSaxBuilder::null() {
  add_value(nlohmann::json(nullptr));
  return true;
}

bool UsageSaxBuilder::boolean(bool val) {
  add_value(nlohmann::json(val));
  return true;
}

bool UsageSaxBuilder::number_integer(number_integer_t val) {
  add_value(nlohmann::json(val));
  return true;
}

bool UsageSaxBuilder::number_unsigned(number_unsigned_t val) {
  add_value(nlohmann::json(val));
  return true;
}

bool UsageSaxBuilder::number_float(number_float_t val, const string_t& s) {
  add_value(nlohmann::json(val));
  if (in_top_level_entry(stack_)) {
    doc_.raw_numbers[{stack_[0]->size() - 1, key_}] = s;
  }
  return true;
}

bool UsageSaxBuilder::string(string_t& val) {
  add_value(nlohmann::json(std::move(val)));
  return true;
}

bool UsageSaxBuilder::binary(binary_t& val) {
  add_value(nlohmann::json(std::move(val)));
  return true;
}

bool UsageSaxBuilder::start_object(std::size_t) {
  stack_.push_back(add_value(nlohmann::json::object()));
  return true;
}

bool UsageSaxBuilder::key(string_t& val) {
  member_ = &(*stack_.back())[val];
  key_ = val;
  // a repeated key replaces the earlier value, raw text included
  if (in_top_level_entry(stack_)) {
    doc_.raw_numbers.erase({stack_[0]->size() - 1, key_});
  }
  return true;
}

bool UsageSaxBuilder::end_object() {
  stack_.pop_back();
  return true;
}

bool UsageSaxBuilder::start_array(std::size_t) {
  stack_.push_back(add_value(nlohmann::json::array()));
  return true;
}

bool UsageSaxBuilder::end_array() {
  stack_.pop_back();
  return true;
}

bool UsageSaxBuilder::parse_error(std::size_t,
                                  const std::string&,
                                  const nlohmann::json::exception& ex) {
  error_ = ex.what();
  return false;
}

bool read_usage_document(const std::string& text,
                         UsageDocument& out,
                         std::string* error_out) {
  out = UsageDocument{};

  UsageSaxBuilder builder(out);
  if (!nlohmann::json::sax_parse(text, &builder)) {
    if (error_out) *error_out = "Invalid JSON: " + builder.error();
    out = UsageDocument{};
    return false;
  }
  return true;
}

} // namespace invoicer
