#include "leak_digest/assembler.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace leak_digest {
namespace {

// A frame with file and line wins over an earlier file-only frame.
std::optional<SourceLocation> best_source_location(const std::vector<StackFrame>& frames) {
  for (const StackFrame& frame : frames) {
    if (frame.source_file.has_value() && frame.line_number.has_value()) {
      return frame.source_location();
    }
  }
  for (const StackFrame& frame : frames) {
    if (frame.source_file.has_value()) {
      return frame.source_location();
    }
  }
  return std::nullopt;
}

}  // namespace

Transition next_transition(ScanState state, LineKind kind) {
  switch (state) {
    case ScanState::Scanning:
      if (kind == LineKind::Header) {
        return {AssemblerAction::Open, ScanState::InTrace};
      }
      return {AssemblerAction::Skip, ScanState::Scanning};
    case ScanState::InTrace:
      switch (kind) {
        case LineKind::Header:
          return {AssemblerAction::CloseAndOpen, ScanState::InTrace};
        case LineKind::Frame:
          return {AssemblerAction::Append, ScanState::InTrace};
        case LineKind::Continuation:
          return {AssemblerAction::Annotate, ScanState::InTrace};
        case LineKind::Other:
          return {AssemblerAction::Close, ScanState::Scanning};
      }
      break;
  }
  return {AssemblerAction::Skip, ScanState::Scanning};
}

void IssueAssembler::on_header(HeaderFields header, std::size_t line_number) {
  const Transition transition = next_transition(state_, LineKind::Header);
  if (transition.action == AssemblerAction::CloseAndOpen) {
    close();
  }
  open(std::move(header), line_number);
  state_ = transition.next;
}

void IssueAssembler::on_frame(StackFrame frame) {
  const Transition transition = next_transition(state_, LineKind::Frame);
  if (transition.action == AssemblerAction::Append && pending_.has_value()) {
    auto& trace = past_continuation_ ? pending_->origin_trace : pending_->stack_trace;
    trace.push_back(std::move(frame));
  }
  state_ = transition.next;
}

void IssueAssembler::on_continuation(bool freed_block) {
  const Transition transition = next_transition(state_, LineKind::Continuation);
  if (transition.action == AssemblerAction::Annotate && pending_.has_value()) {
    past_continuation_ = true;
    if (freed_block && (pending_->issue_type == IssueType::InvalidRead ||
                        pending_->issue_type == IssueType::InvalidWrite)) {
      pending_->issue_type = IssueType::UseAfterFree;
    }
  }
  state_ = transition.next;
}

void IssueAssembler::on_other() {
  const Transition transition = next_transition(state_, LineKind::Other);
  if (transition.action == AssemblerAction::Close) {
    close();
  }
  state_ = transition.next;
}

bool IssueAssembler::finish() {
  const bool ended_in_trace = state_ == ScanState::InTrace && pending_.has_value();
  close();
  state_ = ScanState::Scanning;
  return ended_in_trace;
}

std::vector<IssueRecord> IssueAssembler::take_records() {
  std::vector<IssueRecord> out = std::move(records_);
  records_.clear();
  return out;
}

void IssueAssembler::open(HeaderFields header, std::size_t line_number) {
  IssueRecord record;
  record.issue_type = header.issue_type;
  record.bytes_count = header.bytes_count;
  record.blocks_count = header.blocks_count;
  record.loss_record_id = std::move(header.loss_record_id);
  record.bytes_breakdown = std::move(header.bytes_breakdown);
  record.line_number = line_number;
  record.sequence = next_sequence_++;

  pending_ = std::move(record);
  past_continuation_ = false;
}

void IssueAssembler::close() {
  if (!pending_.has_value()) {
    return;
  }

  IssueRecord record = std::move(*pending_);
  pending_.reset();
  past_continuation_ = false;

  record.source_location = best_source_location(record.stack_trace);
  record.severity = severity_score(record.issue_type, record.bytes_count);

  records_.push_back(std::move(record));
}

}  // namespace leak_digest
