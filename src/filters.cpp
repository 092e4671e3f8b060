// src/filters.cpp
#include "filters.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return s;
}

static bool contains(const std::vector<std::string>& v, const std::string& x) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

FilterMatcher::FilterMatcher(const MetadataFilter& filter) : filter_(filter) {
  for (auto& t : filter_.topics) t = lower(t);

  regs_.reserve(filter_.text_patterns.size());
  for (auto& r : filter_.text_patterns) {
    if (r.empty()) continue;
    auto re = std::make_unique<re2::RE2>(r, re2::RE2::Quiet);
    if (!re->ok())
      throw std::invalid_argument("bad pattern '" + r + "': " + re->error());
    regs_.push_back(std::move(re));
  }
}

FilterMatcher::~FilterMatcher() = default;

bool FilterMatcher::matches(const Metadata& m) const {
  if (!filter_.topics.empty()) {
    std::string topic = lower(m.topic);
    bool any = std::any_of(filter_.topics.begin(), filter_.topics.end(),
                           [&](const std::string& t) { return topic.find(t) != std::string::npos; });
    if (!any) return false;
  }

  if (!filter_.types.empty() && !contains(filter_.types, m.type)) return false;
  if (!filter_.paper_ids.empty() && !contains(filter_.paper_ids, m.paper_id)) return false;

  // absent marks never exclude
  if (m.marks) {
    if (filter_.min_marks && *m.marks < *filter_.min_marks) return false;
    if (filter_.max_marks && *m.marks > *filter_.max_marks) return false;
  }

  if (!regs_.empty()) {
    bool any = false;
    for (auto& re : regs_) {
      if (re2::RE2::PartialMatch(m.text, *re)) { any = true; break; }
    }
    if (!any) return false;
  }
  return true;
}
