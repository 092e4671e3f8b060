#include "index.hpp"
#include "clustering.hpp"
#include "errors.hpp"
#include "store.hpp"
#include <hnswlib/hnswlib.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>

static constexpr int64_t kNoCandidate = -1;

const char* state_name(IndexState s) {
  switch (s) {
    case IndexState::Uninitialized: return "uninitialized";
    case IndexState::Flat: return "flat";
    case IndexState::ClusteredUntrained: return "clustered_untrained";
    case IndexState::ClusteredTrained: return "clustered_trained";
  }
  return "unknown";
}

const char* kind_name(IndexKind k) {
  return k == IndexKind::Ivf ? "ivf" : "flat";
}

std::optional<IndexKind> parse_kind(const std::string& s) {
  if (s == "flat") return IndexKind::Flat;
  if (s == "ivf") return IndexKind::Ivf;
  return std::nullopt;
}

struct Index::Impl {
  std::unique_ptr<Store> store;
  mutable std::shared_mutex mu;

  IndexKind kind;          // persisted kind after a load, else the configured one
  bool fell_back = false;  // a training fallback pins kind to Flat, across clear()
  IndexData data;

  std::unique_ptr<hnswlib::InnerProductSpace> space;
  std::unique_ptr<hnswlib::BruteforceSearch<float>> flat;
  std::unique_ptr<ClusterIndex> clusters;

  void create(const IndexConfig& cfg) {
    data.dim = cfg.dim;
    if (kind == IndexKind::Ivf) {
      clusters.reset(new ClusterIndex(cfg.dim, cfg.nlist, cfg.nprobe));
      data.nlist = clusters->nlist();
      data.nprobe = clusters->nprobe();
      data.state = IndexState::ClusteredUntrained;
    } else {
      data.state = IndexState::Flat;
    }
    spdlog::info("created index: type={} dimension={}", kind_name(kind), cfg.dim);
  }

  void downgrade_to_flat() {
    clusters.reset();
    data.centroids.clear();
    data.nlist = data.nprobe = 0;
    kind = IndexKind::Flat;
    fell_back = true;
    data.state = IndexState::Flat;
  }

  // BruteforceSearch has a fixed capacity; grow by rebuilding from data.vectors.
  void reserve_flat(size_t n) {
    size_t cap = flat ? flat->maxelements_ : 0;
    if (n <= cap) return;
    size_t new_cap = std::max<size_t>({n, cap * 2, 1024});
    if (!space) space.reset(new hnswlib::InnerProductSpace((size_t)data.dim));
    flat.reset(new hnswlib::BruteforceSearch<float>(space.get(), new_cap));
    size_t have = data.vectors.size() / (size_t)data.dim;
    for (size_t i = 0; i < have; ++i)
      flat->addPoint(data.vectors.data() + i * data.dim, (hnswlib::labeltype)i);
  }

  // rows already appended to data.vectors at [first, first + n)
  void index_rows(size_t first, size_t n) {
    const float* rows = data.vectors.data() + first * (size_t)data.dim;
    if (data.state == IndexState::Flat) {
      size_t cap = flat ? flat->maxelements_ : 0;
      if (first + n > cap) {
        reserve_flat(first + n);   // rebuild picks up the new rows too
        return;
      }
      for (size_t i = 0; i < n; ++i)
        flat->addPoint(rows + i * data.dim, (hnswlib::labeltype)(first + i));
    } else {
      clusters->add(rows, n, (int64_t)first);
    }
  }

  // exactly `fetch` candidates, best first, padded with kNoCandidate
  std::vector<std::pair<float, int64_t>> knn(const float* q, size_t fetch) const {
    std::vector<std::pair<float, int64_t>> out;
    if (data.state == IndexState::Flat) {
      // BruteforceSearch reads past its rows when k exceeds them
      auto res = flat->searchKnn(q, std::min(fetch, flat->cur_element_count));
      out.reserve(fetch);
      while (!res.empty()) {
        out.emplace_back(1.0f - res.top().first, (int64_t)res.top().second);
        res.pop();
      }
      std::reverse(out.begin(), out.end());
    } else if (data.state == IndexState::ClusteredTrained) {
      out = clusters->search(q, data.vectors.data(), fetch);
    }
    out.resize(fetch, {0.0f, kNoCandidate});
    return out;
  }

  void rebuild_structures() {
    flat.reset();
    clusters.reset();
    size_t n = data.size();
    if (data.state == IndexState::Flat) {
      kind = IndexKind::Flat;
      reserve_flat(n);
    } else {
      kind = IndexKind::Ivf;
      clusters.reset(new ClusterIndex(data.dim, data.nlist, data.nprobe));
      clusters->restore(data.centroids);
      clusters->add(data.vectors.data(), n, 0);
    }
  }
};

Index::Index(const IndexConfig& cfg, std::unique_ptr<Store> store)
  : cfg_(cfg), impl_(new Impl) {
  if (cfg_.dim <= 0) throw std::invalid_argument("Index: dimension must be > 0");
  if (cfg_.min_training_samples == 0) cfg_.min_training_samples = cfg_.nlist;
  if (cfg_.kind == IndexKind::Ivf) {
    if (cfg_.nlist <= 0) throw std::invalid_argument("Index: nlist must be > 0");
    if (cfg_.min_training_samples < cfg_.nlist)
      throw std::invalid_argument("Index: min_training_samples must be >= nlist");
  }
  impl_->store = std::move(store);
  impl_->kind = cfg_.kind;
  impl_->data.dim = cfg_.dim;
}

Index::~Index() = default;

void Index::load() {
  if (!impl_->store) return;
  auto loaded = impl_->store->load(cfg_.dim);
  std::unique_lock<std::shared_mutex> lock(impl_->mu);
  if (!loaded) {
    spdlog::info("no prior index at {}", impl_->store->path());
    return;
  }
  impl_->data = std::move(*loaded);
  impl_->rebuild_structures();
  spdlog::info("index loaded: {} documents, type={}", impl_->data.size(), kind_name(impl_->kind));
}

size_t Index::add_documents(const std::vector<std::vector<float>>& vectors,
                            const std::vector<Metadata>& metadata,
                            bool deduplicate) {
  if (vectors.size() != metadata.size())
    throw ShapeMismatch("embeddings (" + std::to_string(vectors.size()) + ") and metadata (" +
                        std::to_string(metadata.size()) + ") count mismatch");
  if (vectors.empty()) return 0;
  for (auto& v : vectors) {
    if ((int)v.size() != cfg_.dim)
      throw ShapeMismatch("vector has dimension " + std::to_string(v.size()) +
                          ", index expects " + std::to_string(cfg_.dim));
  }

  std::unique_lock<std::shared_mutex> lock(impl_->mu);
  auto& data = impl_->data;
  const size_t base = data.size();
  const size_t d = (size_t)cfg_.dim;

  // ids land on their final positions; batch-local duplicates are caught too
  std::vector<size_t> keep;
  keep.reserve(vectors.size());
  std::unordered_map<std::string, int64_t> pending;
  for (size_t i = 0; i < vectors.size(); ++i) {
    const std::string& id = external_id(metadata[i]);
    if (deduplicate && (data.meta.lookup(id) || pending.count(id))) continue;
    pending[id] = (int64_t)(base + keep.size());
    keep.push_back(i);
  }
  if (keep.empty()) return 0;

  std::vector<float> batch(keep.size() * d);
  for (size_t j = 0; j < keep.size(); ++j)
    std::copy(vectors[keep[j]].begin(), vectors[keep[j]].end(), batch.begin() + j * d);

  if (data.state == IndexState::Uninitialized) impl_->create(cfg_);

  if (data.state == IndexState::ClusteredUntrained) {
    if (keep.size() >= (size_t)cfg_.min_training_samples) {
      spdlog::info("training ivf index with {} samples", keep.size());
      impl_->clusters->train(batch.data(), keep.size(), cfg_.kmeans_iters, cfg_.seed);
      data.centroids = impl_->clusters->centroids();
      data.state = IndexState::ClusteredTrained;
    } else {
      spdlog::warn("not enough samples ({}) to train ivf index (need {}); using flat search from now on",
                   keep.size(), cfg_.min_training_samples);
      impl_->downgrade_to_flat();
    }
  }

  data.vectors.insert(data.vectors.end(), batch.begin(), batch.end());
  impl_->index_rows(base, keep.size());
  for (size_t i : keep) data.meta.append(metadata[i]);
  for (auto& kv : pending) data.meta.register_id(kv.first, kv.second);

  if (impl_->store) {
    impl_->store->save(data);
    spdlog::info("index saved: {} documents", data.size());
  }
  return keep.size();
}

std::vector<SearchHit> Index::search(const std::vector<float>& q, int k,
                                     const std::optional<MetadataFilter>& filter) const {
  if (k < 1) throw std::invalid_argument("search: k must be >= 1");
  if ((int)q.size() != cfg_.dim)
    throw ShapeMismatch("query has dimension " + std::to_string(q.size()) +
                        ", index expects " + std::to_string(cfg_.dim));

  std::optional<FilterMatcher> matcher;
  if (filter) matcher.emplace(*filter);

  std::shared_lock<std::shared_mutex> lock(impl_->mu);
  const auto& data = impl_->data;
  const size_t n = data.size();
  if (n == 0) return {};

  size_t fetch = std::min<size_t>(filter ? 3 * (size_t)k : (size_t)k, n);
  auto cands = impl_->knn(q.data(), fetch);

  std::vector<SearchHit> hits;
  hits.reserve(std::min<size_t>((size_t)k, fetch));
  for (auto& c : cands) {
    if (c.second == kNoCandidate) continue;
    const Metadata& m = data.meta.get(c.second);
    if (matcher && !matcher->matches(m)) continue;
    hits.push_back(SearchHit{m, c.first});
    if ((int)hits.size() >= k) break;
  }
  spdlog::debug("search: fetched {} candidates, kept {}", fetch, hits.size());
  return hits;
}

void Index::clear() {
  std::unique_lock<std::shared_mutex> lock(impl_->mu);
  impl_->flat.reset();
  impl_->clusters.reset();
  impl_->space.reset();
  impl_->data = IndexData{};
  impl_->data.dim = cfg_.dim;
  // a loaded kind does not outlive the data it came with
  impl_->kind = impl_->fell_back ? IndexKind::Flat : cfg_.kind;
  if (impl_->store) impl_->store->remove();
  spdlog::info("index cleared");
}

size_t Index::size() const {
  std::shared_lock<std::shared_mutex> lock(impl_->mu);
  return impl_->data.size();
}

IndexState Index::state() const {
  std::shared_lock<std::shared_mutex> lock(impl_->mu);
  return impl_->data.state;
}

bool Index::trained() const {
  return stats().trained;
}

IndexStats Index::stats() const {
  std::shared_lock<std::shared_mutex> lock(impl_->mu);
  const auto& data = impl_->data;
  IndexStats s;
  s.size = data.size();
  s.index_kind = kind_name(impl_->kind);
  s.state = data.state;
  s.trained = data.state == IndexState::Flat || data.state == IndexState::ClusteredTrained;
  s.dim = cfg_.dim;
  s.nlist = data.nlist;
  s.nprobe = data.nprobe;
  return s;
}

Metadata Index::metadata_at(int64_t pos) const {
  std::shared_lock<std::shared_mutex> lock(impl_->mu);
  return impl_->data.meta.get(pos);
}

std::vector<float> Index::vector_at(int64_t pos) const {
  std::shared_lock<std::shared_mutex> lock(impl_->mu);
  const auto& data = impl_->data;
  if (pos < 0 || pos >= (int64_t)data.size())
    throw std::out_of_range("vector position " + std::to_string(pos) + " out of range");
  auto first = data.vectors.begin() + pos * cfg_.dim;
  return std::vector<float>(first, first + cfg_.dim);
}

std::vector<Metadata> Index::all_metadata() const {
  std::shared_lock<std::shared_mutex> lock(impl_->mu);
  return impl_->data.meta.records();
}

std::optional<int64_t> Index::position_of(const std::string& external_id) const {
  std::shared_lock<std::shared_mutex> lock(impl_->mu);
  return impl_->data.meta.lookup(external_id);
}
