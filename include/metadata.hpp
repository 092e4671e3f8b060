#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct Metadata {
  std::string id;
  std::string source_id;
  std::string text;
  std::string topic;
  std::string type;
  std::optional<int> marks;
  std::string paper_id;
  // provenance
  std::optional<int> page_number;
  std::optional<std::string> main_question_number;
  std::optional<std::string> sub_question_label;
  std::string ingested_at;
};

// Identity used for dedup: id, else source_id, else "".
const std::string& external_id(const Metadata& m);

// Insertion-ordered metadata plus the id -> position map.
class MetadataStore {
public:
  int64_t append(Metadata m);
  const Metadata& get(int64_t pos) const;   // throws std::out_of_range

  std::optional<int64_t> lookup(const std::string& id) const;
  void register_id(const std::string& id, int64_t pos);

  size_t size() const { return records_.size(); }
  void clear();

  const std::vector<Metadata>& records() const { return records_; }
  const std::unordered_map<std::string, int64_t>& identity() const { return ids_; }

private:
  std::vector<Metadata> records_;
  std::unordered_map<std::string, int64_t> ids_;
};
