#include <CLI/CLI.hpp>

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>

#include "leak_digest/analyzer.hpp"
#include "leak_digest/log_source.hpp"
#include "leak_digest/report.hpp"

namespace {

void print_warnings(const leak_digest::AnalysisResult& result, bool verbose) {
  if (result.warnings.empty()) {
    return;
  }
  if (!verbose) {
    std::cerr << "warning: " << result.warnings.size()
              << " line(s) were dropped or flagged while parsing; rerun with --verbose for details\n";
    return;
  }
  for (const auto& warning : result.warnings) {
    std::cerr << "warning: line " << warning.line_number << ": "
              << leak_digest::warning_reason_name(warning.reason) << ": " << warning.raw_text << '\n';
  }
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"leak-digest: classify Valgrind Memcheck findings into a structured report"};
  app.require_subcommand(1);

  leak_digest::AnalyzeOptions analyze_options;
  leak_digest::ReportOptions report_options;
  std::string format_raw = "table";
  std::string output_path;
  bool lenient = false;
  bool verbose = false;

  CLI::App* analyze = app.add_subcommand("analyze", "Analyze a Valgrind Memcheck log.");
  analyze->add_option("file", analyze_options.file, "Input Valgrind log file.")->required()->check(CLI::ExistingFile);
  analyze->add_option("-f,--format", format_raw, "Report format: table|json|csv.")
      ->default_val("table")
      ->check(CLI::IsMember({"table", "json", "csv"}, CLI::ignore_case));
  auto* output_opt = analyze->add_option("-o,--output", output_path, "Write the report to this file.");
  analyze->add_option("--top", analyze_options.top_n, "Number of top sources to rank (0 for all).")
      ->default_val(10)
      ->check(CLI::NonNegativeNumber);
  analyze->add_option("--frames", report_options.max_frames, "Frames shown per issue in the table (0 for all).")
      ->default_val(5)
      ->check(CLI::NonNegativeNumber);
  analyze->add_option("--wrap-lookahead", analyze_options.wrap_lookahead,
                      "Lines joined when recovering a wrapped issue header.")
      ->default_val(2)
      ->check(CLI::Range(0, 8));
  analyze->add_flag("--lenient", lenient, "Accept files without a Memcheck banner.");
  analyze->add_flag("-v,--verbose", verbose, "Print every parse warning.");

  CLI11_PARSE(app, argc, argv);

  if (*analyze) {
    const auto format = leak_digest::parse_format(format_raw);
    if (!format.has_value()) {
      throw std::invalid_argument("invalid --format value");
    }
    report_options.format = *format;
    analyze_options.strict = !lenient;

    leak_digest::AnalysisResult result;
    try {
      std::cerr << "Analyzing Valgrind log: " << analyze_options.file << '\n';
      const leak_digest::Analyzer analyzer;
      result = analyzer.analyze(analyze_options);
    } catch (const leak_digest::LogSourceError& e) {
      std::cerr << "error: " << e.what() << '\n';
      return 1;
    }

    std::cerr << "Found " << result.statistics.total_issues << " memory issues\n";
    print_warnings(result, verbose);

    if (output_opt->count() > 0) {
      try {
        leak_digest::write_report_file(output_path, result, report_options);
        std::cerr << "Report written: " << output_path << '\n';
        return 0;
      } catch (const leak_digest::ReportError& e) {
        std::cerr << "error: " << e.what() << "; falling back to a table on stdout\n";
        report_options.format = leak_digest::OutputFormat::Table;
      }
    }

    leak_digest::write_report(std::cout, result, report_options);
  }

  return 0;
}
