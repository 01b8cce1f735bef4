#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "leak_digest/issue.hpp"

namespace leak_digest {

enum class ScanState {
  Scanning,
  InTrace,
};

enum class LineKind {
  Header,
  Frame,
  Continuation,
  Other,
};

enum class AssemblerAction {
  Skip,
  Open,
  Append,
  Annotate,
  CloseAndOpen,
  Close,
};

struct Transition {
  AssemblerAction action = AssemblerAction::Skip;
  ScanState next = ScanState::Scanning;
};

Transition next_transition(ScanState state, LineKind kind);

struct HeaderFields {
  IssueType issue_type = IssueType::Other;
  std::uint64_t bytes_count = 0;
  std::uint64_t blocks_count = 0;
  std::string loss_record_id;
  std::string bytes_breakdown;
};

class IssueAssembler {
 public:
  void on_header(HeaderFields header, std::size_t line_number);
  void on_frame(StackFrame frame);
  void on_continuation(bool freed_block);
  void on_other();
  // Closes a pending record; returns true when input ended mid-trace.
  bool finish();

  ScanState state() const { return state_; }
  bool has_pending() const { return pending_.has_value(); }
  const std::vector<IssueRecord>& records() const { return records_; }
  std::vector<IssueRecord> take_records();

 private:
  void open(HeaderFields header, std::size_t line_number);
  void close();

  ScanState state_ = ScanState::Scanning;
  std::optional<IssueRecord> pending_;
  bool past_continuation_ = false;
  std::uint64_t next_sequence_ = 0;
  std::vector<IssueRecord> records_;
};

}  // namespace leak_digest
