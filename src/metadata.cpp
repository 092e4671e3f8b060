#include "metadata.hpp"
#include <stdexcept>

const std::string& external_id(const Metadata& m) {
  if (!m.id.empty()) return m.id;
  return m.source_id;
}

int64_t MetadataStore::append(Metadata m) {
  records_.push_back(std::move(m));
  return (int64_t)records_.size() - 1;
}

const Metadata& MetadataStore::get(int64_t pos) const {
  if (pos < 0 || pos >= (int64_t)records_.size())
    throw std::out_of_range("metadata position " + std::to_string(pos) + " out of range");
  return records_[(size_t)pos];
}

std::optional<int64_t> MetadataStore::lookup(const std::string& id) const {
  auto it = ids_.find(id);
  if (it == ids_.end()) return std::nullopt;
  return it->second;
}

void MetadataStore::register_id(const std::string& id, int64_t pos) {
  ids_[id] = pos;
}

void MetadataStore::clear() {
  records_.clear();
  ids_.clear();
}
