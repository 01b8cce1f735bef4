#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "leak_digest/analyzer.hpp"
#include "leak_digest/issue.hpp"

namespace leak_digest {

enum class OutputFormat {
  Table,
  Json,
  Csv,
};

std::optional<OutputFormat> parse_format(std::string_view raw);
std::string_view format_name(OutputFormat format);

class ReportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ReportOptions {
  OutputFormat format = OutputFormat::Table;
  std::size_t max_frames = 5;
};

std::string escape_json_string(std::string_view value);
std::string escape_csv_field(std::string_view value);
std::string format_frame(const StackFrame& frame);
std::string primary_function(const IssueRecord& record);

void write_table(std::ostream& out, const AnalysisResult& result, std::size_t max_frames);
void write_json(std::ostream& out, const AnalysisResult& result);
void write_csv(std::ostream& out, const AnalysisResult& result);

void write_report(std::ostream& out, const AnalysisResult& result, const ReportOptions& options);
// Throws ReportError when the file cannot be created or written.
void write_report_file(const std::string& path, const AnalysisResult& result, const ReportOptions& options);

}  // namespace leak_digest
