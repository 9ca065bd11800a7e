#pragma once

#include <string>

namespace invoicer {

constexpr const char* kDefaultInputName = "usage-data.json";

// Picks the usage file to load:
//   1. explicit_path, if non-empty (returned as is, existing or not)
//   2. <dir of exe_path>/../usage-data.json, if it exists
//   3. <cwd>/usage-data.json, if it exists
//   4. otherwise the path from step 2, so the load error names it
std::string resolve_input_path(const std::string& explicit_path,
                               const std::string& exe_path);

} // namespace invoicer
