#include "clustering.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <queue>
#include <random>
#include <stdexcept>

static void normalize(float* v, int dim) {
  double s = 0.0;
  for (int i = 0; i < dim; ++i) s += (double)v[i] * (double)v[i];
  float norm = (float)std::sqrt(std::max(s, 1e-12));
  for (int i = 0; i < dim; ++i) v[i] /= norm;
}

struct ClusterIndex::Impl {
  hnswlib::InnerProductSpace space;
  hnswlib::DISTFUNC<float> dist;
  void* dist_param;
  std::vector<float> centroids;
  std::unique_ptr<hnswlib::BruteforceSearch<float>> coarse;  // over centroids, label = list
  std::vector<std::vector<int64_t>> lists;

  explicit Impl(int dim)
    : space((size_t)dim), dist(space.get_dist_func()), dist_param(space.get_dist_func_param()) {}

  void build_coarse(int nlist, int dim) {
    coarse.reset(new hnswlib::BruteforceSearch<float>(&space, (size_t)nlist));
    for (int c = 0; c < nlist; ++c)
      coarse->addPoint(centroids.data() + (size_t)c * dim, (hnswlib::labeltype)c);
    lists.assign((size_t)nlist, {});
  }

  // nearest centroid by scanning; used while the centroids still move
  int nearest(const float* v, int nlist, int dim) const {
    int best = 0;
    float best_d = dist(v, centroids.data(), dist_param);
    for (int c = 1; c < nlist; ++c) {
      float d = dist(v, centroids.data() + (size_t)c * dim, dist_param);
      if (d < best_d) { best_d = d; best = c; }
    }
    return best;
  }
};

ClusterIndex::ClusterIndex(int dim, int nlist, int nprobe)
  : dim_(dim), nlist_(nlist), nprobe_(std::max(1, std::min(nprobe, nlist))), impl_(new Impl(dim)) {
  if (dim <= 0 || nlist <= 0) throw std::invalid_argument("ClusterIndex: dim and nlist must be > 0");
}

ClusterIndex::~ClusterIndex() = default;

bool ClusterIndex::trained() const { return impl_->coarse != nullptr; }

const std::vector<float>& ClusterIndex::centroids() const { return impl_->centroids; }

void ClusterIndex::train(const float* x, size_t n, int iters, uint32_t seed) {
  if (n < (size_t)nlist_) throw std::invalid_argument("ClusterIndex::train: fewer rows than lists");
  const size_t d = (size_t)dim_;
  auto& cent = impl_->centroids;
  cent.assign((size_t)nlist_ * d, 0.0f);

  // seed with distinct random rows
  std::mt19937 rng(seed);
  std::vector<size_t> perm(n);
  std::iota(perm.begin(), perm.end(), 0);
  std::shuffle(perm.begin(), perm.end(), rng);
  for (int c = 0; c < nlist_; ++c)
    std::copy(x + perm[(size_t)c] * d, x + (perm[(size_t)c] + 1) * d, cent.begin() + (size_t)c * d);

  std::vector<int> assign(n, -1);
  std::vector<double> sums((size_t)nlist_ * d);
  std::vector<size_t> counts((size_t)nlist_);
  std::uniform_int_distribution<size_t> pick(0, n - 1);

  for (int it = 0; it < iters; ++it) {
    bool moved = false;
    for (size_t i = 0; i < n; ++i) {
      int c = impl_->nearest(x + i * d, nlist_, dim_);
      if (c != assign[i]) { assign[i] = c; moved = true; }
    }
    if (!moved && it > 0) break;

    std::fill(sums.begin(), sums.end(), 0.0);
    std::fill(counts.begin(), counts.end(), 0);
    for (size_t i = 0; i < n; ++i) {
      size_t c = (size_t)assign[i];
      counts[c]++;
      for (size_t j = 0; j < d; ++j) sums[c * d + j] += x[i * d + j];
    }
    for (size_t c = 0; c < (size_t)nlist_; ++c) {
      float* dst = cent.data() + c * d;
      if (counts[c] == 0) {
        // empty list: reseed from a random row
        size_t r = pick(rng);
        std::copy(x + r * d, x + (r + 1) * d, dst);
        continue;
      }
      for (size_t j = 0; j < d; ++j) dst[j] = (float)(sums[c * d + j] / (double)counts[c]);
      normalize(dst, dim_);
    }
  }
  impl_->build_coarse(nlist_, dim_);
}

void ClusterIndex::restore(std::vector<float> centroids) {
  if (centroids.size() != (size_t)nlist_ * dim_)
    throw std::invalid_argument("ClusterIndex::restore: centroid block has the wrong size");
  impl_->centroids = std::move(centroids);
  impl_->build_coarse(nlist_, dim_);
}

void ClusterIndex::add(const float* x, size_t n, int64_t first_pos) {
  if (!trained()) throw std::logic_error("ClusterIndex::add before train");
  for (size_t i = 0; i < n; ++i) {
    auto res = impl_->coarse->searchKnn(x + i * (size_t)dim_, 1);
    impl_->lists[res.top().second].push_back(first_pos + (int64_t)i);
  }
}

std::vector<std::pair<float, int64_t>>
ClusterIndex::search(const float* q, const float* base, size_t k) const {
  std::vector<std::pair<float, int64_t>> out;
  if (!trained() || k == 0) return out;

  auto probes = impl_->coarse->searchKnn(q, (size_t)nprobe_);

  // max-heap on distance keeps the k closest
  std::priority_queue<std::pair<float, int64_t>> top;
  while (!probes.empty()) {
    for (int64_t pos : impl_->lists[probes.top().second]) {
      float d = impl_->dist(q, base + (size_t)pos * dim_, impl_->dist_param);
      if (top.size() < k) top.emplace(d, pos);
      else if (d < top.top().first) { top.pop(); top.emplace(d, pos); }
    }
    probes.pop();
  }

  out.reserve(top.size());
  while (!top.empty()) {
    out.emplace_back(1.0f - top.top().first, top.top().second);
    top.pop();
  }
  std::reverse(out.begin(), out.end());
  return out;
}
