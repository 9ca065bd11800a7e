#include "invoicer/input_locator.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace invoicer {

std::string resolve_input_path(const std::string& explicit_path,
                               const std::string& exe_path) {
  if (!explicit_path.empty()) return explicit_path;

  const fs::path beside_exe = fs::path(exe_path).parent_path() / ".." / kDefaultInputName;

  std::error_code ec;
  if (fs::is_regular_file(beside_exe, ec)) return beside_exe.string();

  const fs::path cwd = fs::current_path(ec);
  if (!ec) {
    const fs::path in_cwd = cwd / kDefaultInputName;
    if (fs::is_regular_file(in_cwd, ec)) return in_cwd.string();
  }

  return beside_exe.string();
}

} // namespace invoicer
