#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "leak_digest/issue.hpp"

namespace leak_digest {

// Strict weak order: criticality desc, bytes desc, encounter order asc.
bool ranks_before(const IssueRecord& lhs, const IssueRecord& rhs);

// Location when known, else the first resolved function name.
std::optional<std::string> source_key(const IssueRecord& record);

class IssueClassifier {
 public:
  ClassifiedIssues classify(const std::vector<IssueRecord>& records) const;
  std::vector<IssueRecord> flatten(const ClassifiedIssues& classified) const;
  Statistics compute_statistics(const ClassifiedIssues& classified, std::size_t top_n = 10) const;

  std::vector<IssueRecord> prioritize(std::vector<IssueRecord> records) const;
  std::vector<IssueRecord> critical_issues(const std::vector<IssueRecord>& records) const;
};

}  // namespace leak_digest
