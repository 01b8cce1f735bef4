#include "leak_digest/issue.hpp"

#include <cctype>
#include <string>

namespace leak_digest {
namespace {

std::string to_lower_copy(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (unsigned char ch : input) {
    out.push_back(static_cast<char>(std::tolower(ch)));
  }
  return out;
}

}  // namespace

std::string_view issue_type_name(IssueType type) {
  switch (type) {
    case IssueType::DefinitelyLost:
      return "definitely_lost";
    case IssueType::PossiblyLost:
      return "possibly_lost";
    case IssueType::StillReachable:
      return "still_reachable";
    case IssueType::InvalidRead:
      return "invalid_read";
    case IssueType::InvalidWrite:
      return "invalid_write";
    case IssueType::UseAfterFree:
      return "use_after_free";
    case IssueType::Other:
      return "other";
  }
  return "other";
}

std::string_view issue_type_label(IssueType type) {
  switch (type) {
    case IssueType::DefinitelyLost:
      return "Definitely Lost";
    case IssueType::PossiblyLost:
      return "Possibly Lost";
    case IssueType::StillReachable:
      return "Still Reachable";
    case IssueType::InvalidRead:
      return "Invalid Read";
    case IssueType::InvalidWrite:
      return "Invalid Write";
    case IssueType::UseAfterFree:
      return "Use After Free";
    case IssueType::Other:
      return "Other";
  }
  return "Other";
}

std::optional<IssueType> parse_issue_type(std::string_view raw) {
  const std::string lower = to_lower_copy(raw);
  for (IssueType type : kAllIssueTypes) {
    if (lower == issue_type_name(type)) {
      return type;
    }
  }
  return std::nullopt;
}

std::string_view severity_level_name(SeverityLevel level) {
  switch (level) {
    case SeverityLevel::Critical:
      return "critical";
    case SeverityLevel::High:
      return "high";
    case SeverityLevel::Medium:
      return "medium";
    case SeverityLevel::Low:
      return "low";
  }
  return "medium";
}

SeverityLevel severity_level(IssueType type) {
  switch (type) {
    case IssueType::DefinitelyLost:
    case IssueType::InvalidRead:
    case IssueType::InvalidWrite:
    case IssueType::UseAfterFree:
      return SeverityLevel::Critical;
    case IssueType::PossiblyLost:
      return SeverityLevel::High;
    case IssueType::StillReachable:
      return SeverityLevel::Low;
    case IssueType::Other:
      return SeverityLevel::Medium;
  }
  return SeverityLevel::Medium;
}

int criticality(IssueType type) {
  switch (type) {
    case IssueType::DefinitelyLost:
      return 6;
    case IssueType::InvalidWrite:
      return 5;
    case IssueType::InvalidRead:
      return 4;
    case IssueType::UseAfterFree:
      return 3;
    case IssueType::PossiblyLost:
      return 2;
    case IssueType::StillReachable:
      return 1;
    case IssueType::Other:
      return 0;
  }
  return 0;
}

int severity_score(IssueType type, std::uint64_t bytes_count) {
  int width = 0;
  while (bytes_count != 0) {
    bytes_count >>= 1;
    ++width;
  }
  return criticality(type) * 65 + width;
}

std::string_view warning_reason_name(WarningReason reason) {
  switch (reason) {
    case WarningReason::MalformedNumber:
      return "malformed_number";
    case WarningReason::UnrecognizedIssueType:
      return "unrecognized_issue_type";
    case WarningReason::IncompleteTrace:
      return "incomplete_trace";
  }
  return "unknown";
}

std::string SourceLocation::to_string() const {
  if (!line.has_value()) {
    return file;
  }
  return file + ":" + std::to_string(*line);
}

bool operator==(const SourceLocation& lhs, const SourceLocation& rhs) {
  return lhs.file == rhs.file && lhs.line == rhs.line;
}

bool operator!=(const SourceLocation& lhs, const SourceLocation& rhs) {
  return !(lhs == rhs);
}

std::optional<SourceLocation> StackFrame::source_location() const {
  if (!source_file.has_value()) {
    return std::nullopt;
  }
  return SourceLocation{*source_file, line_number};
}

bool operator==(const StackFrame& lhs, const StackFrame& rhs) {
  return lhs.address == rhs.address && lhs.function_name == rhs.function_name &&
         lhs.library == rhs.library && lhs.source_file == rhs.source_file &&
         lhs.line_number == rhs.line_number;
}

bool operator!=(const StackFrame& lhs, const StackFrame& rhs) {
  return !(lhs == rhs);
}

bool operator==(const IssueRecord& lhs, const IssueRecord& rhs) {
  return lhs.issue_type == rhs.issue_type && lhs.bytes_count == rhs.bytes_count &&
         lhs.blocks_count == rhs.blocks_count && lhs.loss_record_id == rhs.loss_record_id &&
         lhs.bytes_breakdown == rhs.bytes_breakdown && lhs.stack_trace == rhs.stack_trace &&
         lhs.origin_trace == rhs.origin_trace && lhs.source_location == rhs.source_location &&
         lhs.severity == rhs.severity && lhs.line_number == rhs.line_number &&
         lhs.sequence == rhs.sequence;
}

bool operator!=(const IssueRecord& lhs, const IssueRecord& rhs) {
  return !(lhs == rhs);
}

std::size_t ClassifiedIssues::size() const {
  std::size_t total = 0;
  for (const auto& records : by_type) {
    total += records.size();
  }
  return total;
}

bool operator==(const ClassifiedIssues& lhs, const ClassifiedIssues& rhs) {
  return lhs.by_type == rhs.by_type;
}

}  // namespace leak_digest
