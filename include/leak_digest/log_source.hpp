#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace leak_digest {

class LogSourceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

inline constexpr std::size_t kBannerSearchLines = 50;

bool has_memcheck_banner(const std::vector<std::string>& lines, std::size_t search_lines = kBannerSearchLines);

// Reads every line, dropping a trailing '\r'. With `strict`, a non-empty file
// must carry a Memcheck banner near its start.
std::vector<std::string> read_log_lines(const std::string& path, bool strict);

}  // namespace leak_digest
