#include "leak_digest/log_source.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <system_error>

namespace leak_digest {

bool has_memcheck_banner(const std::vector<std::string>& lines, std::size_t search_lines) {
  static const std::regex banner(R"(==\d+==\s+Memcheck,)");
  const std::size_t limit = std::min(search_lines, lines.size());
  for (std::size_t i = 0; i < limit; ++i) {
    if (std::regex_search(lines[i], banner)) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> read_log_lines(const std::string& path, bool strict) {
  std::error_code ec;
  const std::filesystem::file_status status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    throw LogSourceError("file does not exist: " + path);
  }
  if (!std::filesystem::is_regular_file(status)) {
    throw LogSourceError("path is not a file: " + path);
  }

  std::ifstream in(path, std::ios::in);
  if (!in.is_open()) {
    throw LogSourceError("failed to open file: " + path);
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  if (in.bad()) {
    throw LogSourceError("error reading file: " + path);
  }

  if (strict && !lines.empty() && !has_memcheck_banner(lines)) {
    throw LogSourceError("file does not appear to be a Valgrind Memcheck log (no banner within the first " +
                         std::to_string(kBannerSearchLines) + " lines): " + path);
  }

  return lines;
}

}  // namespace leak_digest
