#include "leak_digest/parser.hpp"

#include <optional>
#include <utility>

#include "leak_digest/assembler.hpp"
#include "leak_digest/number.hpp"

namespace leak_digest {
namespace {

HeaderFields to_fields(HeaderMatch& header) {
  const NormalizedCount bytes = normalize_count(header.bytes_token);
  const NormalizedCount blocks = normalize_count(header.blocks_token);

  HeaderFields fields;
  fields.issue_type = header.issue_type;
  fields.bytes_count = bytes.value;
  fields.blocks_count = blocks.value;
  fields.loss_record_id = std::move(header.loss_record_id);
  fields.bytes_breakdown = bytes.breakdown;
  return fields;
}

std::string join_lines(const std::vector<std::string>& lines, std::size_t first, std::size_t count) {
  std::string out = lines[first];
  for (std::size_t i = 1; i < count; ++i) {
    out += '\n';
    out += lines[first + i];
  }
  return out;
}

}  // namespace

LogParser::LogParser(ParserOptions options) : options_(options) {}

ParseResult LogParser::parse(const std::vector<std::string>& lines) const {
  ParseResult result;
  IssueAssembler assembler;

  std::size_t index = 0;
  while (index < lines.size()) {
    const std::string& line = lines[index];
    const std::size_t line_number = index + 1;
    std::size_t consumed = 1;

    if (patterns_.is_summary(line)) {
      assembler.on_other();
      ++index;
      continue;
    }

    std::optional<HeaderMatch> header;
    if (auto recovered = patterns_.recover_wrapped_header(lines, index, options_.wrap_lookahead);
        recovered.has_value()) {
      header = std::move(recovered->header);
      consumed = recovered->lines_consumed;
    } else {
      header = patterns_.match_header(line);
    }

    if (header.has_value()) {
      const bool recognized = header->recognized;
      try {
        HeaderFields fields = to_fields(*header);
        if (!recognized) {
          result.warnings.push_back(
              ParseWarning{line_number, join_lines(lines, index, consumed), WarningReason::UnrecognizedIssueType});
        }
        assembler.on_header(std::move(fields), line_number);
      } catch (const MalformedNumber&) {
        result.warnings.push_back(
            ParseWarning{line_number, join_lines(lines, index, consumed), WarningReason::MalformedNumber});
        assembler.on_other();
      }
    } else if (auto frame = patterns_.match_frame(line); frame.has_value()) {
      assembler.on_frame(std::move(*frame));
    } else if (const auto continuation = patterns_.match_continuation(line); continuation.has_value()) {
      assembler.on_continuation(continuation->freed);
    } else {
      assembler.on_other();
    }

    index += consumed;
  }

  if (assembler.finish()) {
    result.warnings.push_back(ParseWarning{lines.size(), lines.back(), WarningReason::IncompleteTrace});
  }

  result.records = assembler.take_records();
  return result;
}

}  // namespace leak_digest
