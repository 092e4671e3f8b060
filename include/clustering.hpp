#pragma once
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

// Inverted lists over a spherical k-means partition, inner-product metric.
// Lists hold positions; the vectors themselves stay in the caller's storage.
class ClusterIndex {
public:
  ClusterIndex(int dim, int nlist, int nprobe);
  ~ClusterIndex();

  bool trained() const;
  int nlist() const { return nlist_; }
  int nprobe() const { return nprobe_; }
  const std::vector<float>& centroids() const;

  // n >= nlist rows of dim floats
  void train(const float* x, size_t n, int iters, uint32_t seed);
  // restores persisted centroids (nlist * dim floats)
  void restore(std::vector<float> centroids);

  // assigns rows x[0..n) to lists as positions first_pos, first_pos+1, ...
  void add(const float* x, size_t n, int64_t first_pos);

  // Up to k (score, position) pairs from the nprobe closest lists, best first.
  // base is the row-major vector storage addressed by position.
  std::vector<std::pair<float, int64_t>> search(const float* q, const float* base, size_t k) const;

private:
  int dim_, nlist_, nprobe_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
