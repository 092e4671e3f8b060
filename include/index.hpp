#pragma once
#include "filters.hpp"
#include "index_state.hpp"
#include "store.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class Store;

struct IndexConfig {
  int dim = 384;
  IndexKind kind = IndexKind::Flat;
  int nlist = 100;                 // clusters, ivf only
  int nprobe = 10;                 // clusters searched per query
  int min_training_samples = 0;    // 0 means nlist
  int kmeans_iters = 20;
  uint32_t seed = 1234;
};

struct SearchHit {
  Metadata meta;
  float score;   // raw inner product
};

struct IndexStats {
  size_t size = 0;
  std::string index_kind;
  IndexState state = IndexState::Uninitialized;
  bool trained = false;
  int dim = 0;
  int nlist = 0;
  int nprobe = 0;
};

// Vector storage plus exact (flat) or clustered nearest-neighbour search,
// positionally aligned with a MetadataStore. Writers are exclusive, readers
// share. With a Store attached every successful add is persisted before it
// returns.
class Index {
public:
  explicit Index(const IndexConfig& cfg, std::unique_ptr<Store> store = nullptr);
  ~Index();

  Index(const Index&) = delete;
  Index& operator=(const Index&) = delete;

  // Restores persisted state, if any. Throws CorruptIndexError.
  void load();

  // Returns the number of rows appended after dedup. Throws ShapeMismatch
  // before touching anything, PersistenceError after the rows are in memory.
  size_t add_documents(const std::vector<std::vector<float>>& vectors,
                       const std::vector<Metadata>& metadata,
                       bool deduplicate = true);

  // Filters are applied after an over-fetch of min(3k, size) candidates, so a
  // selective filter may return fewer than k hits even if more matches exist.
  std::vector<SearchHit> search(const std::vector<float>& q, int k,
                                const std::optional<MetadataFilter>& filter = std::nullopt) const;

  // Drops everything, including the persisted database.
  void clear();

  size_t size() const;
  int dim() const { return cfg_.dim; }
  IndexState state() const;
  bool trained() const;
  IndexStats stats() const;

  Metadata metadata_at(int64_t pos) const;
  std::vector<float> vector_at(int64_t pos) const;
  std::vector<Metadata> all_metadata() const;
  std::optional<int64_t> position_of(const std::string& external_id) const;

private:
  IndexConfig cfg_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
