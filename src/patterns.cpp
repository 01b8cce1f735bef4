#include "leak_digest/patterns.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <system_error>
#include <utility>

namespace leak_digest {
namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

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

bool starts_with_icase(std::string_view input, std::string_view prefix) {
  if (input.size() < prefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(input[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

std::optional<std::uint32_t> parse_line_number(const std::string& digits) {
  std::uint32_t value = 0;
  const auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (result.ec != std::errc{} || result.ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

struct FrameDescription {
  std::string_view head;
  std::optional<std::string_view> annotation;
};

// Splits "symbol (annotation)" on the last balanced parenthetical that is
// preceded by whitespace. "(below main)" on its own is a symbol.
FrameDescription split_description(std::string_view description) {
  FrameDescription out;
  out.head = description;
  if (description.empty() || description.back() != ')') {
    return out;
  }

  int depth = 0;
  for (std::size_t i = description.size(); i > 0; --i) {
    const char ch = description[i - 1];
    if (ch == ')') {
      ++depth;
    } else if (ch == '(') {
      --depth;
      if (depth == 0) {
        const std::size_t open = i - 1;
        if (open == 0 || std::isspace(static_cast<unsigned char>(description[open - 1])) == 0) {
          return out;
        }
        out.head = trim(description.substr(0, open));
        out.annotation = trim(description.substr(open + 1, description.size() - open - 2));
        return out;
      }
    }
  }
  return out;
}

}  // namespace

std::string_view strip_pid_prefix(std::string_view line) {
  std::string_view body = trim(line);
  if (body.size() >= 2 && (body.substr(0, 2) == "==" || body.substr(0, 2) == "--")) {
    const std::string_view marker = body.substr(0, 2);
    std::size_t pos = 2;
    while (pos < body.size() && std::isdigit(static_cast<unsigned char>(body[pos])) != 0) {
      ++pos;
    }
    if (pos > 2 && body.substr(pos, 2) == marker) {
      body = trim(body.substr(pos + 2));
    }
  }
  return body;
}

LinePatterns::LinePatterns()
    : summary_(R"(^(?:(?:leak|heap|error)\s+summary:.*|in\s+use\s+at\s+exit:.*|total\s+heap\s+usage:.*|(?:definitely|indirectly|possibly)\s+lost:\s+[\d,]+\s+bytes?\s+in\s+[\d,]+\s+blocks?.*|still\s+reachable:\s+[\d,]+\s+bytes?\s+in\s+[\d,]+\s+blocks?.*|suppressed:\s+[\d,]+\s+bytes?\s+in\s+[\d,]+\s+blocks?.*|of\s+which\s+reachable\s+via\s+heuristic:.*)$)",
               kFlags),
      leak_header_(R"(^([\d,]+(?:\s*\([^)]*\))?)\s+bytes?\s+in\s+([\d,]+)\s+blocks?\s+(?:are|is)\s+(.+?)(?:\s+in\s+loss\s+record\s+(.+?))?\s*$)",
                   kFlags),
      access_header_(R"(^invalid\s+(read|write)\s+of\s+size\s+([\d,]+)\s*$)", kFlags),
      free_header_(R"(^(?:invalid|mismatched)\s+free\s*\(\).*$)", kFlags),
      definitely_lost_(R"(^definitel?y\s+lost$)", kFlags),
      possibly_lost_(R"(^possibl?y\s+lost$)", kFlags),
      still_reachable_(R"(^still\s+reachabl?e$)", kFlags),
      frame_(R"(^(at|by)\s+(0x[0-9a-f]+)(?::\s*(.*))?$)", kFlags),
      address_line_(R"(^address\s+0x[0-9a-f]+\s+is\s+(.*)$)", kFlags),
      freed_block_(R"(block\s+of\s+size\s+[\d,]+\s+free'd)", kFlags),
      alloc_site_line_(R"(^block\s+was\s+alloc'd\s+at\s*$)", kFlags),
      file_line_(R"(^(.+):(\d+)$)", kFlags) {}

bool LinePatterns::is_summary(std::string_view line) const {
  const std::string body{strip_pid_prefix(line)};
  return !body.empty() && std::regex_match(body, summary_);
}

std::optional<HeaderMatch> LinePatterns::match_header(std::string_view line) const {
  const std::string body{strip_pid_prefix(line)};
  if (body.empty() || std::regex_match(body, summary_)) {
    return std::nullopt;
  }
  return match_header_body(body);
}

std::optional<HeaderMatch> LinePatterns::match_header_body(const std::string& body) const {
  std::smatch match;
  if (std::regex_match(body, match, leak_header_)) {
    HeaderMatch header;
    header.bytes_token = match[1].str();
    header.blocks_token = match[2].str();
    header.verdict = match[3].str();
    if (match[4].matched) {
      header.loss_record_id = match[4].str();
    }

    if (std::regex_match(header.verdict, definitely_lost_)) {
      header.issue_type = IssueType::DefinitelyLost;
    } else if (std::regex_match(header.verdict, possibly_lost_)) {
      header.issue_type = IssueType::PossiblyLost;
    } else if (std::regex_match(header.verdict, still_reachable_)) {
      header.issue_type = IssueType::StillReachable;
    } else {
      header.issue_type = IssueType::Other;
      header.recognized = false;
    }
    return header;
  }

  if (std::regex_match(body, match, access_header_)) {
    HeaderMatch header;
    const char kind = static_cast<char>(std::tolower(static_cast<unsigned char>(match[1].str().front())));
    header.issue_type = kind == 'r' ? IssueType::InvalidRead : IssueType::InvalidWrite;
    header.bytes_token = match[2].str();
    header.blocks_token = "1";
    header.verdict = body;
    return header;
  }

  if (std::regex_match(body, free_header_)) {
    HeaderMatch header;
    header.issue_type = IssueType::Other;
    header.bytes_token = "0";
    header.blocks_token = "1";
    header.verdict = body;
    return header;
  }

  return std::nullopt;
}

std::optional<StackFrame> LinePatterns::match_frame(std::string_view line) const {
  const std::string body{strip_pid_prefix(line)};
  std::smatch match;
  if (!std::regex_match(body, match, frame_)) {
    return std::nullopt;
  }

  StackFrame frame;
  frame.address = match[2].str();

  const std::string description = match[3].matched ? match[3].str() : std::string{};
  const FrameDescription parts = split_description(trim(description));
  if (!parts.head.empty() && parts.head != "???") {
    frame.function_name = std::string{parts.head};
  }

  if (parts.annotation.has_value()) {
    const std::string_view annotation = *parts.annotation;
    if (starts_with_icase(annotation, "in ")) {
      frame.library = std::string{trim(annotation.substr(3))};
    } else if (const auto location = extract_source_location(description); location.has_value()) {
      frame.source_file = location->file;
      frame.line_number = location->line;
    } else if (!annotation.empty() && annotation != "???") {
      // A ":digits" suffix that did not fit a line number is not part of the file name.
      const std::string text{annotation};
      std::smatch suffix;
      if (std::regex_match(text, suffix, file_line_)) {
        frame.source_file = std::string{trim(suffix[1].str())};
      } else {
        frame.source_file = text;
      }
    }
  }

  if (frame.address.empty() && !frame.function_name.has_value()) {
    return std::nullopt;
  }
  return frame;
}

std::optional<ContinuationMatch> LinePatterns::match_continuation(std::string_view line) const {
  const std::string body{strip_pid_prefix(line)};
  std::smatch match;
  if (std::regex_match(body, match, address_line_)) {
    const std::string tail = match[1].str();
    return ContinuationMatch{std::regex_search(tail, freed_block_)};
  }
  if (std::regex_match(body, alloc_site_line_)) {
    return ContinuationMatch{false};
  }
  return std::nullopt;
}

std::optional<SourceLocation> LinePatterns::extract_source_location(std::string_view description) const {
  std::string_view trimmed = trim(description);
  std::optional<std::string_view> annotation = split_description(trimmed).annotation;
  if (!annotation.has_value() && trimmed.size() >= 2 && trimmed.front() == '(' && trimmed.back() == ')') {
    annotation = trim(trimmed.substr(1, trimmed.size() - 2));
  }
  if (!annotation.has_value() || starts_with_icase(*annotation, "in ")) {
    return std::nullopt;
  }

  const std::string text{*annotation};
  std::smatch match;
  if (!std::regex_match(text, match, file_line_)) {
    return std::nullopt;
  }
  const auto line = parse_line_number(match[2].str());
  if (!line.has_value()) {
    return std::nullopt;
  }
  return SourceLocation{std::string{trim(match[1].str())}, line};
}

bool LinePatterns::is_complete(const std::optional<HeaderMatch>& header) const {
  return header.has_value() && (header->recognized || !header->loss_record_id.empty());
}

bool LinePatterns::may_be_partial_header(std::string_view body) const {
  if (body.empty()) {
    return false;
  }
  return std::isdigit(static_cast<unsigned char>(body.front())) != 0 || starts_with_icase(body, "inv") ||
         starts_with_icase(body, "mis");
}

std::optional<RecoveredHeader> LinePatterns::recover_wrapped_header(const std::vector<std::string>& lines,
                                                                     std::size_t index,
                                                                     std::size_t max_lookahead) const {
  if (index >= lines.size()) {
    return std::nullopt;
  }

  const std::string first{strip_pid_prefix(lines[index])};
  if (!may_be_partial_header(first) || std::regex_match(first, summary_) ||
      is_complete(match_header_body(first))) {
    return std::nullopt;
  }

  // A known verdict wins; an unknown verdict that reaches its loss record
  // reference is kept as a fallback.
  std::optional<RecoveredHeader> fallback;
  std::string joined_tight = first;
  std::string joined_spaced = first;
  for (std::size_t extra = 1; extra <= max_lookahead && index + extra < lines.size(); ++extra) {
    const std::string next{strip_pid_prefix(lines[index + extra])};
    if (next.empty() || std::regex_match(next, summary_) || match_frame(next).has_value() ||
        match_continuation(next).has_value() || is_complete(match_header_body(next))) {
      break;
    }

    joined_tight += next;
    joined_spaced += ' ';
    joined_spaced += next;

    for (const std::string* candidate : {&joined_tight, &joined_spaced}) {
      auto header = match_header_body(*candidate);
      if (header.has_value() && header->recognized) {
        return RecoveredHeader{std::move(*header), extra + 1};
      }
      if (!fallback.has_value() && candidate == &joined_spaced && is_complete(header)) {
        fallback = RecoveredHeader{std::move(*header), extra + 1};
      }
    }
  }

  return fallback;
}

}  // namespace leak_digest
