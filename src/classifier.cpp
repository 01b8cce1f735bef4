#include "leak_digest/classifier.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <unordered_map>
#include <utility>

namespace leak_digest {
namespace {

struct SourceTally {
  std::uint64_t count = 0;
  std::uint64_t first_seen = 0;
  std::size_t insertion = 0;
};

struct RankedSource {
  SourceCount entry;
  std::uint64_t first_seen = 0;
  std::size_t insertion = 0;
};

bool is_leak(IssueType type) {
  return type == IssueType::DefinitelyLost || type == IssueType::PossiblyLost ||
         type == IssueType::StillReachable;
}

}  // namespace

bool ranks_before(const IssueRecord& lhs, const IssueRecord& rhs) {
  const int lhs_rank = criticality(lhs.issue_type);
  const int rhs_rank = criticality(rhs.issue_type);
  if (lhs_rank != rhs_rank) {
    return lhs_rank > rhs_rank;
  }
  if (lhs.bytes_count != rhs.bytes_count) {
    return lhs.bytes_count > rhs.bytes_count;
  }
  return lhs.sequence < rhs.sequence;
}

std::optional<std::string> source_key(const IssueRecord& record) {
  if (record.source_location.has_value()) {
    return record.source_location->to_string();
  }
  for (const StackFrame& frame : record.stack_trace) {
    if (frame.function_name.has_value()) {
      return *frame.function_name;
    }
  }
  return std::nullopt;
}

ClassifiedIssues IssueClassifier::classify(const std::vector<IssueRecord>& records) const {
  ClassifiedIssues classified;
  for (const IssueRecord& record : records) {
    classified.by_type[index_of(record.issue_type)].push_back(record);
  }
  return classified;
}

std::vector<IssueRecord> IssueClassifier::flatten(const ClassifiedIssues& classified) const {
  std::vector<IssueRecord> out;
  out.reserve(classified.size());
  for (const auto& records : classified.by_type) {
    out.insert(out.end(), records.begin(), records.end());
  }
  return out;
}

Statistics IssueClassifier::compute_statistics(const ClassifiedIssues& classified, std::size_t top_n) const {
  Statistics stats;
  std::unordered_map<std::string, SourceTally> sources;

  for (IssueType type : kAllIssueTypes) {
    const std::size_t slot = index_of(type);
    for (const IssueRecord& record : classified.of(type)) {
      ++stats.total_issues;
      stats.total_bytes += record.bytes_count;
      stats.total_blocks += record.blocks_count;
      ++stats.issues_by_type[slot];
      stats.bytes_by_type[slot] += record.bytes_count;
      stats.blocks_by_type[slot] += record.blocks_count;
      ++stats.severity_distribution[index_of(severity_level(type))];

      if (is_leak(type)) {
        ++stats.leaks.issues;
        stats.leaks.bytes += record.bytes_count;
        stats.leaks.blocks += record.blocks_count;
      }

      if (auto key = source_key(record); key.has_value()) {
        auto [it, inserted] = sources.try_emplace(std::move(*key), SourceTally{0, record.sequence, sources.size()});
        ++it->second.count;
        if (!inserted) {
          it->second.first_seen = std::min(it->second.first_seen, record.sequence);
        }
      }
    }
  }

  for (std::size_t slot = 0; slot < kIssueTypeCount; ++slot) {
    if (stats.total_issues > 0) {
      stats.percentage_by_type[slot] =
          static_cast<double>(stats.issues_by_type[slot]) / static_cast<double>(stats.total_issues);
    }
    if (stats.total_bytes > 0) {
      stats.bytes_percentage_by_type[slot] =
          static_cast<double>(stats.bytes_by_type[slot]) / static_cast<double>(stats.total_bytes);
    }
  }

  std::vector<RankedSource> ranked;
  ranked.reserve(sources.size());
  for (auto& [source, tally] : sources) {
    ranked.push_back(RankedSource{SourceCount{source, tally.count}, tally.first_seen, tally.insertion});
  }

  // Records sharing a sequence number fall back to the order their sources were first tallied.
  std::sort(ranked.begin(), ranked.end(), [](const RankedSource& lhs, const RankedSource& rhs) {
    if (lhs.entry.count != rhs.entry.count) {
      return lhs.entry.count > rhs.entry.count;
    }
    if (lhs.first_seen != rhs.first_seen) {
      return lhs.first_seen < rhs.first_seen;
    }
    return lhs.insertion < rhs.insertion;
  });

  const std::size_t limit = top_n == 0 ? ranked.size() : std::min(top_n, ranked.size());
  stats.top_sources.reserve(limit);
  for (std::size_t i = 0; i < limit; ++i) {
    stats.top_sources.push_back(std::move(ranked[i].entry));
  }

  return stats;
}

std::vector<IssueRecord> IssueClassifier::prioritize(std::vector<IssueRecord> records) const {
  std::stable_sort(records.begin(), records.end(), ranks_before);
  return records;
}

std::vector<IssueRecord> IssueClassifier::critical_issues(const std::vector<IssueRecord>& records) const {
  std::vector<IssueRecord> critical;
  std::copy_if(records.begin(), records.end(), std::back_inserter(critical), [](const IssueRecord& record) {
    return severity_level(record.issue_type) == SeverityLevel::Critical;
  });
  return prioritize(std::move(critical));
}

}  // namespace leak_digest
