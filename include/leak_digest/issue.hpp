#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace leak_digest {

enum class IssueType {
  DefinitelyLost = 0,
  PossiblyLost = 1,
  StillReachable = 2,
  InvalidRead = 3,
  InvalidWrite = 4,
  UseAfterFree = 5,
  Other = 6,
};

inline constexpr std::size_t kIssueTypeCount = 7;

inline constexpr std::array<IssueType, kIssueTypeCount> kAllIssueTypes{
    IssueType::DefinitelyLost, IssueType::PossiblyLost, IssueType::StillReachable,
    IssueType::InvalidRead,    IssueType::InvalidWrite, IssueType::UseAfterFree,
    IssueType::Other,
};

enum class SeverityLevel {
  Critical = 0,
  High = 1,
  Medium = 2,
  Low = 3,
};

inline constexpr std::size_t kSeverityLevelCount = 4;

std::string_view issue_type_name(IssueType type);
std::string_view issue_type_label(IssueType type);
std::optional<IssueType> parse_issue_type(std::string_view raw);
std::string_view severity_level_name(SeverityLevel level);
SeverityLevel severity_level(IssueType type);

// DefinitelyLost ranks highest (6), Other lowest (0).
int criticality(IssueType type);
// criticality * 65 + bit width of the byte count; larger is more severe.
int severity_score(IssueType type, std::uint64_t bytes_count);

constexpr std::size_t index_of(IssueType type) {
  return static_cast<std::size_t>(type);
}

constexpr std::size_t index_of(SeverityLevel level) {
  return static_cast<std::size_t>(level);
}

struct SourceLocation {
  std::string file;
  std::optional<std::uint32_t> line;

  std::string to_string() const;
};

bool operator==(const SourceLocation& lhs, const SourceLocation& rhs);
bool operator!=(const SourceLocation& lhs, const SourceLocation& rhs);

struct StackFrame {
  std::string address;
  std::optional<std::string> function_name;
  std::optional<std::string> library;
  std::optional<std::string> source_file;
  std::optional<std::uint32_t> line_number;

  std::optional<SourceLocation> source_location() const;
};

bool operator==(const StackFrame& lhs, const StackFrame& rhs);
bool operator!=(const StackFrame& lhs, const StackFrame& rhs);

struct IssueRecord {
  IssueType issue_type = IssueType::Other;
  std::uint64_t bytes_count = 0;
  std::uint64_t blocks_count = 0;
  std::string loss_record_id;
  std::string bytes_breakdown;
  std::vector<StackFrame> stack_trace;
  std::vector<StackFrame> origin_trace;
  std::optional<SourceLocation> source_location;
  int severity = 0;
  std::size_t line_number = 0;
  std::uint64_t sequence = 0;
};

bool operator==(const IssueRecord& lhs, const IssueRecord& rhs);
bool operator!=(const IssueRecord& lhs, const IssueRecord& rhs);

enum class WarningReason {
  MalformedNumber,
  UnrecognizedIssueType,
  IncompleteTrace,
};

std::string_view warning_reason_name(WarningReason reason);

struct ParseWarning {
  std::size_t line_number = 0;
  std::string raw_text;
  WarningReason reason = WarningReason::MalformedNumber;
};

struct ClassifiedIssues {
  std::array<std::vector<IssueRecord>, kIssueTypeCount> by_type;

  const std::vector<IssueRecord>& of(IssueType type) const { return by_type[index_of(type)]; }
  std::size_t size() const;
};

bool operator==(const ClassifiedIssues& lhs, const ClassifiedIssues& rhs);

struct SourceCount {
  std::string source;
  std::uint64_t count = 0;
};

struct LeakSummary {
  std::uint64_t issues = 0;
  std::uint64_t bytes = 0;
  std::uint64_t blocks = 0;
};

struct Statistics {
  std::uint64_t total_issues = 0;
  std::uint64_t total_bytes = 0;
  std::uint64_t total_blocks = 0;
  std::array<std::uint64_t, kIssueTypeCount> issues_by_type{};
  std::array<std::uint64_t, kIssueTypeCount> bytes_by_type{};
  std::array<std::uint64_t, kIssueTypeCount> blocks_by_type{};
  std::array<double, kIssueTypeCount> percentage_by_type{};
  std::array<double, kIssueTypeCount> bytes_percentage_by_type{};
  std::array<std::uint64_t, kSeverityLevelCount> severity_distribution{};
  std::vector<SourceCount> top_sources;
  LeakSummary leaks;
};

}  // namespace leak_digest
