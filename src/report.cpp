#include "leak_digest/report.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#include "leak_digest/classifier.hpp"

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

std::string format_ratio(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

std::string loss_record_or_na(const IssueRecord& record) {
  return record.loss_record_id.empty() ? std::string{"N/A"} : record.loss_record_id;
}

std::string location_or_unknown(const IssueRecord& record) {
  return record.source_location.has_value() ? record.source_location->to_string() : std::string{"Unknown"};
}

void write_json_frames(std::ostream& out, const std::vector<StackFrame>& frames) {
  out << '[';
  for (std::size_t i = 0; i < frames.size(); ++i) {
    const StackFrame& frame = frames[i];
    out << "{\"address\": \"" << escape_json_string(frame.address) << '"';
    if (frame.function_name.has_value()) {
      out << ", \"function\": \"" << escape_json_string(*frame.function_name) << '"';
    }
    if (frame.library.has_value()) {
      out << ", \"library\": \"" << escape_json_string(*frame.library) << '"';
    }
    if (frame.source_file.has_value()) {
      out << ", \"file\": \"" << escape_json_string(*frame.source_file) << '"';
    }
    if (frame.line_number.has_value()) {
      out << ", \"line\": " << *frame.line_number;
    }
    out << '}';
    if (i + 1 < frames.size()) {
      out << ", ";
    }
  }
  out << ']';
}

}  // namespace

std::optional<OutputFormat> parse_format(std::string_view raw) {
  const std::string lower = to_lower_copy(raw);
  if (lower == "table") {
    return OutputFormat::Table;
  }
  if (lower == "json") {
    return OutputFormat::Json;
  }
  if (lower == "csv") {
    return OutputFormat::Csv;
  }
  return std::nullopt;
}

std::string_view format_name(OutputFormat format) {
  switch (format) {
    case OutputFormat::Table:
      return "table";
    case OutputFormat::Json:
      return "json";
    case OutputFormat::Csv:
      return "csv";
  }
  return "table";
}

std::string escape_json_string(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const unsigned char ch : value) {
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (ch < 0x20) {
          out += "?";
        } else {
          out.push_back(static_cast<char>(ch));
        }
    }
  }
  return out;
}

std::string escape_csv_field(std::string_view value) {
  if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string{value};
  }

  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (const char ch : value) {
    if (ch == '"') {
      out.push_back('"');
    }
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

std::string format_frame(const StackFrame& frame) {
  std::string out = frame.address + ": " + frame.function_name.value_or("???");
  if (const auto location = frame.source_location(); location.has_value()) {
    out += " (" + location->to_string() + ")";
  } else if (frame.library.has_value()) {
    out += " (in " + *frame.library + ")";
  }
  return out;
}

std::string primary_function(const IssueRecord& record) {
  for (const StackFrame& frame : record.stack_trace) {
    if (frame.function_name.has_value()) {
      return *frame.function_name;
    }
  }
  return "Unknown";
}

void write_table(std::ostream& out, const AnalysisResult& result, std::size_t max_frames) {
  const Statistics& stats = result.statistics;

  out << "Lines scanned:  " << result.total_lines << '\n';
  out << "Issues found:   " << stats.total_issues << '\n';
  out << "Total bytes:    " << stats.total_bytes << '\n';
  out << "Total blocks:   " << stats.total_blocks << '\n';
  out << "Parse warnings: " << result.warnings.size() << '\n';

  out << "\nBy type:\n";
  out << std::left << std::setw(18) << "Type" << std::right << std::setw(8) << "Count" << std::setw(14)
      << "Bytes" << std::setw(10) << "Blocks" << std::setw(9) << "Share" << '\n';
  for (IssueType type : kAllIssueTypes) {
    const std::size_t slot = index_of(type);
    out << std::left << std::setw(18) << issue_type_label(type) << std::right << std::setw(8)
        << stats.issues_by_type[slot] << std::setw(14) << stats.bytes_by_type[slot] << std::setw(10)
        << stats.blocks_by_type[slot] << std::setw(8) << format_ratio(stats.percentage_by_type[slot] * 100.0, 1)
        << "%\n";
  }

  out << "\nSeverity:"
      << " critical=" << stats.severity_distribution[index_of(SeverityLevel::Critical)]
      << " high=" << stats.severity_distribution[index_of(SeverityLevel::High)]
      << " medium=" << stats.severity_distribution[index_of(SeverityLevel::Medium)]
      << " low=" << stats.severity_distribution[index_of(SeverityLevel::Low)] << '\n';
  out << "Leaks:    issues=" << stats.leaks.issues << " bytes=" << stats.leaks.bytes
      << " blocks=" << stats.leaks.blocks << '\n';

  out << "\nTop sources:\n";
  if (stats.top_sources.empty()) {
    out << "(no resolvable sources)\n";
  } else {
    out << "Rank  Count  Source\n";
    for (std::size_t i = 0; i < stats.top_sources.size(); ++i) {
      const auto& entry = stats.top_sources[i];
      out << std::left << std::setw(6) << (i + 1) << std::setw(7) << entry.count << std::right << entry.source
          << '\n';
    }
  }

  out << "\nIssues:\n";
  if (result.records.empty()) {
    out << "(no memory issues found)\n";
    return;
  }

  const IssueClassifier classifier;
  for (const IssueRecord& record : classifier.prioritize(result.records)) {
    out << '[' << severity_level_name(severity_level(record.issue_type)) << "] "
        << issue_type_label(record.issue_type) << ": " << record.bytes_count << " bytes in "
        << record.blocks_count << " blocks";
    if (!record.loss_record_id.empty()) {
      out << " (loss record " << record.loss_record_id << ')';
    }
    out << " at line " << record.line_number << '\n';

    const std::size_t shown = max_frames == 0 ? record.stack_trace.size()
                                              : std::min(max_frames, record.stack_trace.size());
    for (std::size_t i = 0; i < shown; ++i) {
      out << "    " << (i == 0 ? "at " : "by ") << format_frame(record.stack_trace[i]) << '\n';
    }
    if (shown < record.stack_trace.size()) {
      out << "    ... " << (record.stack_trace.size() - shown) << " more frames\n";
    }
  }
}

void write_json(std::ostream& out, const AnalysisResult& result) {
  const Statistics& stats = result.statistics;

  out << "{\n";
  out << "  \"total_lines\": " << result.total_lines << ",\n";
  out << "  \"statistics\": {\n";
  out << "    \"total_issues\": " << stats.total_issues << ",\n";
  out << "    \"total_bytes\": " << stats.total_bytes << ",\n";
  out << "    \"total_blocks\": " << stats.total_blocks << ",\n";
  out << "    \"by_type\": {\n";
  for (std::size_t i = 0; i < kAllIssueTypes.size(); ++i) {
    const IssueType type = kAllIssueTypes[i];
    const std::size_t slot = index_of(type);
    out << "      \"" << issue_type_name(type) << "\": {\"issues\": " << stats.issues_by_type[slot]
        << ", \"bytes\": " << stats.bytes_by_type[slot] << ", \"blocks\": " << stats.blocks_by_type[slot]
        << ", \"percentage\": " << format_ratio(stats.percentage_by_type[slot], 6)
        << ", \"bytes_percentage\": " << format_ratio(stats.bytes_percentage_by_type[slot], 6) << '}';
    if (i + 1 < kAllIssueTypes.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << "    },\n";
  out << "    \"severity\": {\"critical\": " << stats.severity_distribution[index_of(SeverityLevel::Critical)]
      << ", \"high\": " << stats.severity_distribution[index_of(SeverityLevel::High)]
      << ", \"medium\": " << stats.severity_distribution[index_of(SeverityLevel::Medium)]
      << ", \"low\": " << stats.severity_distribution[index_of(SeverityLevel::Low)] << "},\n";
  out << "    \"leaks\": {\"issues\": " << stats.leaks.issues << ", \"bytes\": " << stats.leaks.bytes
      << ", \"blocks\": " << stats.leaks.blocks << "},\n";
  out << "    \"top_sources\": [\n";
  for (std::size_t i = 0; i < stats.top_sources.size(); ++i) {
    const auto& entry = stats.top_sources[i];
    out << "      {\"source\": \"" << escape_json_string(entry.source) << "\", \"count\": " << entry.count
        << '}';
    if (i + 1 < stats.top_sources.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << "    ]\n";
  out << "  },\n";

  out << "  \"issues\": [\n";
  for (std::size_t i = 0; i < result.records.size(); ++i) {
    const IssueRecord& record = result.records[i];
    out << "    {\"type\": \"" << issue_type_name(record.issue_type) << "\", \"severity\": \""
        << severity_level_name(severity_level(record.issue_type)) << "\", \"rank\": " << record.severity
        << ", \"bytes\": " << record.bytes_count << ", \"blocks\": " << record.blocks_count
        << ", \"loss_record\": \"" << escape_json_string(record.loss_record_id) << "\", \"line\": "
        << record.line_number;
    if (!record.bytes_breakdown.empty()) {
      out << ", \"breakdown\": \"" << escape_json_string(record.bytes_breakdown) << '"';
    }
    if (record.source_location.has_value()) {
      out << ", \"source_location\": \"" << escape_json_string(record.source_location->to_string()) << '"';
    }
    out << ", \"stack\": ";
    write_json_frames(out, record.stack_trace);
    if (!record.origin_trace.empty()) {
      out << ", \"origin_stack\": ";
      write_json_frames(out, record.origin_trace);
    }
    out << '}';
    if (i + 1 < result.records.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << "  ],\n";

  out << "  \"warnings\": [\n";
  for (std::size_t i = 0; i < result.warnings.size(); ++i) {
    const ParseWarning& warning = result.warnings[i];
    out << "    {\"line\": " << warning.line_number << ", \"reason\": \"" << warning_reason_name(warning.reason)
        << "\", \"text\": \"" << escape_json_string(warning.raw_text) << "\"}";
    if (i + 1 < result.warnings.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << "  ]\n";
  out << "}\n";
}

void write_csv(std::ostream& out, const AnalysisResult& result) {
  out << "Issue Type,Severity,Bytes,Blocks,Loss Record,Primary Function,Source Location\n";

  const IssueClassifier classifier;
  for (const IssueRecord& record : classifier.prioritize(result.records)) {
    out << escape_csv_field(issue_type_label(record.issue_type)) << ','
        << severity_level_name(severity_level(record.issue_type)) << ',' << record.bytes_count << ','
        << record.blocks_count << ',' << escape_csv_field(loss_record_or_na(record)) << ','
        << escape_csv_field(primary_function(record)) << ',' << escape_csv_field(location_or_unknown(record))
        << '\n';
  }
}

void write_report(std::ostream& out, const AnalysisResult& result, const ReportOptions& options) {
  switch (options.format) {
    case OutputFormat::Table:
      write_table(out, result, options.max_frames);
      return;
    case OutputFormat::Json:
      write_json(out, result);
      return;
    case OutputFormat::Csv:
      write_csv(out, result);
      return;
  }
}

void write_report_file(const std::string& path, const AnalysisResult& result, const ReportOptions& options) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    throw ReportError("failed to create report file: " + path);
  }

  write_report(out, result, options);
  out.flush();
  if (!out) {
    throw ReportError("failed to write report file: " + path);
  }
}

}  // namespace leak_digest
