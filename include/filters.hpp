#pragma once
#include "metadata.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace re2 { class RE2; }

// Conjunction of optional clauses. An empty list means the clause is not set.
// Multiple values inside one clause are OR'ed.
struct MetadataFilter {
  std::vector<std::string> topics;         // case-insensitive substring of topic
  std::vector<std::string> types;          // exact
  std::vector<std::string> paper_ids;      // exact
  std::optional<int> min_marks;
  std::optional<int> max_marks;
  std::vector<std::string> text_patterns;  // RE2 syntax, partial match on text
};

// A filter with its patterns compiled once per search.
class FilterMatcher {
public:
  explicit FilterMatcher(const MetadataFilter& filter);  // std::invalid_argument on a bad pattern
  ~FilterMatcher();

  bool matches(const Metadata& m) const;

private:
  MetadataFilter filter_;
  std::vector<std::unique_ptr<re2::RE2>> regs_;
};
