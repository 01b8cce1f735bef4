#include "leak_digest/number.hpp"

#include <cctype>
#include <limits>

namespace leak_digest {
namespace {

std::string_view trim(std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }

  return input.substr(start, end - start);
}

}  // namespace

MalformedNumber::MalformedNumber(const std::string& token)
    : std::invalid_argument("malformed count: '" + token + "'"), token_(token) {}

NormalizedCount normalize_count(std::string_view token) {
  const std::string_view trimmed = trim(token);

  std::uint64_t value = 0;
  std::size_t digits = 0;
  std::size_t pos = 0;
  bool previous_was_comma = false;
  for (; pos < trimmed.size(); ++pos) {
    const unsigned char ch = static_cast<unsigned char>(trimmed[pos]);
    if (ch == ',') {
      // A separator must sit between digits.
      if (digits == 0 || previous_was_comma) {
        throw MalformedNumber(std::string{token});
      }
      previous_was_comma = true;
      continue;
    }
    if (std::isdigit(ch) == 0) {
      break;
    }

    const std::uint64_t digit = ch - static_cast<unsigned char>('0');
    if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
      throw MalformedNumber(std::string{token});
    }
    value = value * 10 + digit;
    ++digits;
    previous_was_comma = false;
  }

  if (digits == 0 || previous_was_comma) {
    throw MalformedNumber(std::string{token});
  }

  NormalizedCount out;
  out.value = value;

  const std::string_view rest = trim(trimmed.substr(pos));
  if (!rest.empty()) {
    if (rest.front() != '(') {
      throw MalformedNumber(std::string{token});
    }
    const std::size_t close = rest.find(')');
    const std::size_t stop = close == std::string_view::npos ? rest.size() : close;
    out.breakdown = std::string{trim(rest.substr(1, stop - 1))};
  }

  return out;
}

}  // namespace leak_digest
