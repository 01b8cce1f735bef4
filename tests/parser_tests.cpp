#include "leak_digest/parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

const std::vector<std::string> kMemcheckLog = {
    "==4242== Memcheck, a memory error detector",
    "==4242== Copyright (C) 2002-2017, and GNU GPL'd, by Julian Seward et al.",
    "==4242== Command: ./prog",
    "==4242== ",
    "==4242== Invalid write of size 4",
    "==4242==    at 0x108A2B: fill (prog.c:21)",
    "==4242==    by 0x108B10: main (prog.c:40)",
    "==4242==  Address 0x522d068 is 0 bytes after a block of size 40 alloc'd",
    "==4242==    at 0x4C2FB0F: malloc (vg_replace_malloc.c:299)",
    "==4242==    by 0x108AF0: main (prog.c:38)",
    "==4242== ",
    "==4242== Invalid read of size 8",
    "==4242==    at 0x108A60: peek (prog.c:30)",
    "==4242==    by 0x108B20: main (prog.c:44)",
    "==4242==  Address 0x522d0c0 is 0 bytes inside a block of size 16 free'd",
    "==4242==    at 0x4C30D3B: free (vg_replace_malloc.c:530)",
    "==4242==    by 0x108B18: main (prog.c:43)",
    "==4242==  Block was alloc'd at",
    "==4242==    at 0x4C2FB0F: malloc (vg_replace_malloc.c:299)",
    "==4242==    by 0x108B00: main (prog.c:42)",
    "==4242== ",
    "==4242== HEAP SUMMARY:",
    "==4242==     in use at exit: 1,336 bytes in 4 blocks",
    "==4242==   total heap usage: 9 allocs, 5 frees, 2,400 bytes allocated",
    "==4242== ",
    "==4242== 32 bytes in 1 blocks are definitely lost in loss record 1 of 4",
    "==4242==    at 0x4C2FB0F: malloc (vg_replace_malloc.c:299)",
    "==4242==    by 0x108950: make_node (list.c:12)",
    "==4242==    by 0x108B30: main (prog.c:50)",
    "==4242== ",
    "==4242== 72 (16 direct, 56 indirect) bytes in 1 blocks are definitely lost in loss record 3 of 4",
    "==4242==    at 0x4C2FB0F: malloc (vg_replace_malloc.c:299)",
    "==4242==    by 0x108950: make_node (list.c:12)",
    "==4242==    by 0x108B40: ??? (in /home/user/prog)",
    "==4242== ",
    "==4242== 1,204 bytes in 1 blocks are still reachable in loss record 4 of 4",
    "==4242==    at 0x4C2FB0F: malloc (vg_replace_malloc.c:299)",
    "==4242==    by 0x4EC3A1B: ??? (in /lib/x86_64-linux-gnu/libc-2.27.so)",
    "==4242== ",
    "==4242== LEAK SUMMARY:",
    "==4242==    definitely lost: 48 bytes in 2 blocks",
    "==4242==    indirectly lost: 56 bytes in 1 blocks",
    "==4242==      possibly lost: 0 bytes in 0 blocks",
    "==4242==    still reachable: 1,204 bytes in 1 blocks",
    "==4242==         suppressed: 0 bytes in 0 blocks",
    "==4242== ",
    "==4242== ERROR SUMMARY: 4 errors from 4 contexts (suppressed: 0 from 0)",
};

}  // namespace

TEST_CASE("parser assembles every issue block of a memcheck log", "[parser]") {
  const leak_digest::LogParser parser;
  const leak_digest::ParseResult result = parser.parse(kMemcheckLog);

  REQUIRE(result.warnings.empty());
  REQUIRE(result.records.size() == 5);

  const auto& overflow = result.records[0];
  REQUIRE(overflow.issue_type == leak_digest::IssueType::InvalidWrite);
  REQUIRE(overflow.bytes_count == 4);
  REQUIRE(overflow.blocks_count == 1);
  REQUIRE(overflow.line_number == 5);
  REQUIRE(overflow.stack_trace.size() == 2);
  REQUIRE(overflow.origin_trace.size() == 2);
  REQUIRE(overflow.source_location->to_string() == "prog.c:21");

  const auto& dangling = result.records[1];
  REQUIRE(dangling.issue_type == leak_digest::IssueType::UseAfterFree);
  REQUIRE(dangling.bytes_count == 8);
  REQUIRE(dangling.stack_trace.size() == 2);
  REQUIRE(dangling.origin_trace.size() == 4);

  const auto& lost = result.records[2];
  REQUIRE(lost.issue_type == leak_digest::IssueType::DefinitelyLost);
  REQUIRE(lost.bytes_count == 32);
  REQUIRE(lost.loss_record_id == "1 of 4");
  REQUIRE(lost.stack_trace.size() == 3);
  REQUIRE(lost.source_location->to_string() == "vg_replace_malloc.c:299");

  const auto& indirect = result.records[3];
  REQUIRE(indirect.bytes_count == 72);
  REQUIRE(indirect.bytes_breakdown == "16 direct, 56 indirect");
  REQUIRE(indirect.stack_trace.size() == 3);
  REQUIRE_FALSE(indirect.stack_trace[2].function_name.has_value());
  REQUIRE(indirect.stack_trace[2].library == "/home/user/prog");

  const auto& reachable = result.records[4];
  REQUIRE(reachable.issue_type == leak_digest::IssueType::StillReachable);
  REQUIRE(reachable.bytes_count == 1204);
  REQUIRE(reachable.stack_trace.size() == 2);

  for (std::size_t i = 0; i < result.records.size(); ++i) {
    REQUIRE(result.records[i].sequence == i);
  }
}

TEST_CASE("leak header with loss record is decoded exactly", "[parser]") {
  const leak_digest::LogParser parser;
  const auto result = parser.parse({"==1234==    32 bytes in 1 blocks are definitely lost in loss record 5 of 12"});

  REQUIRE(result.records.size() == 1);
  REQUIRE(result.records[0].issue_type == leak_digest::IssueType::DefinitelyLost);
  REQUIRE(result.records[0].bytes_count == 32);
  REQUIRE(result.records[0].blocks_count == 1);
  REQUIRE(result.records[0].loss_record_id == "5 of 12");
  REQUIRE(result.records[0].stack_trace.empty());
}

TEST_CASE("summary blocks never produce records", "[parser]") {
  const leak_digest::LogParser parser;
  const auto result = parser.parse({
      "==1234== LEAK SUMMARY:",
      "==1234==    definitely lost: 32 bytes in 1 blocks",
      "==1234==    indirectly lost: 0 bytes in 0 blocks",
      "==1234==      possibly lost: 0 bytes in 0 blocks",
      "==1234==    still reachable: 0 bytes in 0 blocks",
  });

  REQUIRE(result.records.empty());
  REQUIRE(result.warnings.empty());
}

TEST_CASE("empty input yields no records and no warnings", "[parser]") {
  const leak_digest::LogParser parser;
  const auto result = parser.parse({});
  REQUIRE(result.records.empty());
  REQUIRE(result.warnings.empty());
}

TEST_CASE("partial trace at end of input is emitted with a diagnostic", "[parser]") {
  const leak_digest::LogParser parser;
  const auto result = parser.parse({
      "==7== 16 bytes in 1 blocks are possibly lost in loss record 1 of 1",
      "==7==    at 0x4C2FB0F: malloc (vg_replace_malloc.c:299)",
      "==7==    by 0x108950: grow (buf.c:77)",
  });

  REQUIRE(result.records.size() == 1);
  REQUIRE(result.records[0].stack_trace.size() == 2);
  REQUIRE(result.warnings.size() == 1);
  REQUIRE(result.warnings[0].reason == leak_digest::WarningReason::IncompleteTrace);
  REQUIRE(result.warnings[0].line_number == 3);
}

TEST_CASE("malformed count drops the record and closes the previous one", "[parser]") {
  const leak_digest::LogParser parser;
  const auto result = parser.parse({
      "==7== 8 bytes in 1 blocks are definitely lost in loss record 1 of 3",
      "==7==    at 0x4C2FB0F: malloc (vg_replace_malloc.c:299)",
      "==7== 1,,2 bytes in 1 blocks are definitely lost in loss record 2 of 3",
      "==7==    at 0x4C2FB0F: malloc (vg_replace_malloc.c:299)",
      "==7==    by 0x108950: orphan (orphan.c:3)",
      "==7== ",
      "==7== 4 bytes in 1 blocks are definitely lost in loss record 3 of 3",
      "==7==    at 0x108960: last (last.c:1)",
      "==7== ",
  });

  REQUIRE(result.records.size() == 2);
  REQUIRE(result.records[0].bytes_count == 8);
  REQUIRE(result.records[0].stack_trace.size() == 1);
  REQUIRE(result.records[1].bytes_count == 4);
  REQUIRE(result.records[1].stack_trace.size() == 1);

  REQUIRE(result.warnings.size() == 1);
  REQUIRE(result.warnings[0].reason == leak_digest::WarningReason::MalformedNumber);
  REQUIRE(result.warnings[0].line_number == 3);
  REQUIRE(result.warnings[0].raw_text.find("1,,2 bytes") != std::string::npos);
}

TEST_CASE("unknown verdict is kept as Other with a diagnostic", "[parser]") {
  const leak_digest::LogParser parser;
  const auto result = parser.parse({
      "==7== 24 bytes in 1 blocks are indirectly lost in loss record 2 of 5",
      "==7==    at 0x4C2FB0F: malloc (vg_replace_malloc.c:299)",
      "==7== ",
  });

  REQUIRE(result.records.size() == 1);
  REQUIRE(result.records[0].issue_type == leak_digest::IssueType::Other);
  REQUIRE(result.records[0].bytes_count == 24);
  REQUIRE(result.warnings.size() == 1);
  REQUIRE(result.warnings[0].reason == leak_digest::WarningReason::UnrecognizedIssueType);
}

TEST_CASE("wrapped header is recovered and its frames attached", "[parser]") {
  const leak_digest::LogParser parser;
  const auto result = parser.parse({
      "==7== 32 bytes in 1 blocks are defini",
      "==7== tely lost in loss record 5 of 12",
      "==7==    at 0x4C2FB0F: malloc (vg_replace_malloc.c:299)",
      "==7==    by 0x108B30: main (prog.c:50)",
      "==7== ",
  });

  REQUIRE(result.warnings.empty());
  REQUIRE(result.records.size() == 1);
  REQUIRE(result.records[0].issue_type == leak_digest::IssueType::DefinitelyLost);
  REQUIRE(result.records[0].line_number == 1);
  REQUIRE(result.records[0].loss_record_id == "5 of 12");
  REQUIRE(result.records[0].stack_trace.size() == 2);
}

TEST_CASE("zero wrap lookahead disables recovery", "[parser]") {
  leak_digest::ParserOptions options;
  options.wrap_lookahead = 0;
  const leak_digest::LogParser parser(options);
  const auto result = parser.parse({
      "==7== 32 bytes in 1 blocks are defini",
      "==7== tely lost in loss record 5 of 12",
  });

  REQUIRE(result.records.size() == 1);
  REQUIRE(result.records[0].issue_type == leak_digest::IssueType::Other);
  REQUIRE(result.warnings.size() == 1);
  REQUIRE(result.warnings[0].reason == leak_digest::WarningReason::UnrecognizedIssueType);
}

TEST_CASE("record count never exceeds header count", "[parser]") {
  const leak_digest::LogParser parser;
  const auto result = parser.parse({
      "random banner text",
      "==1== 8 bytes in 1 blocks are definitely lost in loss record 1 of 2",
      "==1==    at 0x1: a (a.c:1)",
      "==1==    at 0x2: b (b.c:2)",
      "not a valgrind line",
      "==1==    at 0x3: stray (s.c:3)",
      "==1== 9 bytes in 1 blocks are possibly lost in loss record 2 of 2",
  });

  REQUIRE(result.records.size() == 2);
  REQUIRE(result.records[0].stack_trace.size() == 2);
  REQUIRE(result.records[1].stack_trace.empty());
  REQUIRE(result.warnings.size() == 1);
  REQUIRE(result.warnings[0].reason == leak_digest::WarningReason::IncompleteTrace);
}

TEST_CASE("record location prefers a frame with a line number", "[parser]") {
  const leak_digest::LogParser parser;
  const auto result = parser.parse({
      "==9== 10 bytes in 1 blocks are definitely lost in loss record 1 of 1",
      "==9==    at 0x4C2AB80: malloc (vg_replace_malloc.c)",
      "==9==    by 0x400537: main (test.c:5)",
      "==9== ",
  });

  REQUIRE(result.records.size() == 1);
  REQUIRE(result.records[0].source_location->to_string() == "test.c:5");
}
