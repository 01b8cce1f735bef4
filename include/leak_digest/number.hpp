#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace leak_digest {

class MalformedNumber : public std::invalid_argument {
 public:
  explicit MalformedNumber(const std::string& token);

  const std::string& token() const { return token_; }

 private:
  std::string token_;
};

struct NormalizedCount {
  std::uint64_t value = 0;
  // Parenthetical breakdown such as "16 direct, 56 indirect", kept for display only.
  std::string breakdown;
};

// Accepts "1,204", "72 (16 direct, 56 indirect)" and plain digit strings.
// Throws MalformedNumber when no leading digit group exists or it overflows.
NormalizedCount normalize_count(std::string_view token);

}  // namespace leak_digest
