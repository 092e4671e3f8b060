#include "clustering.hpp"
#include "index.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <set>

static IndexConfig ivf_config(int dim, int nlist, int nprobe) {
  IndexConfig cfg;
  cfg.dim = dim;
  cfg.kind = IndexKind::Ivf;
  cfg.nlist = nlist;
  cfg.nprobe = nprobe;
  return cfg;
}

static void add_random(Index& idx, int n, const std::string& prefix, std::mt19937& rng,
                       std::vector<std::vector<float>>* out = nullptr) {
  std::vector<std::vector<float>> vecs;
  std::vector<Metadata> metas;
  for (int i = 0; i < n; ++i) {
    vecs.push_back(random_unit(idx.dim(), rng));
    metas.push_back(make_meta(prefix + std::to_string(i)));
  }
  idx.add_documents(vecs, metas);
  if (out) *out = vecs;
}

// groups of points scattered tightly around each axis
static std::vector<std::vector<float>> grouped(int dim, int groups, int per_group, std::mt19937& rng) {
  std::normal_distribution<float> noise(0.0f, 0.05f);
  std::vector<std::vector<float>> out;
  for (int g = 0; g < groups; ++g) {
    for (int i = 0; i < per_group; ++i) {
      auto v = axis(dim, g);
      for (auto& x : v) x += noise(rng);
      out.push_back(unit(v));
    }
  }
  return out;
}

TEST(ClusteringTest, LargeFirstBatchTrainsTheIndex) {
  std::mt19937 rng(1);
  Index idx(ivf_config(8, 4, 4));
  EXPECT_FALSE(idx.trained());

  std::vector<std::vector<float>> vecs;
  add_random(idx, 64, "d", rng, &vecs);
  EXPECT_EQ(idx.state(), IndexState::ClusteredTrained);
  EXPECT_TRUE(idx.trained());
  EXPECT_EQ(idx.stats().index_kind, "ivf");
  EXPECT_EQ(idx.stats().nlist, 4);

  // probing every list is exhaustive
  auto hits = idx.search(vecs[40], 3);
  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].meta.id, "d40");
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);

  // later batches of any size are simply assigned to lists
  add_random(idx, 2, "late", rng);
  EXPECT_EQ(idx.size(), 66u);
  EXPECT_EQ(idx.state(), IndexState::ClusteredTrained);
}

TEST(ClusteringTest, SmallFirstBatchFallsBackToFlatForGood) {
  std::mt19937 rng(2);
  Index idx(ivf_config(8, 8, 2));
  add_random(idx, 3, "small", rng);
  EXPECT_EQ(idx.state(), IndexState::Flat);
  EXPECT_EQ(idx.stats().index_kind, "flat");
  EXPECT_TRUE(idx.trained());

  add_random(idx, 50, "big", rng);
  EXPECT_EQ(idx.state(), IndexState::Flat);
  EXPECT_EQ(idx.size(), 53u);
}

TEST(ClusteringTest, FallbackOutlivesClear) {
  std::mt19937 rng(3);
  Index idx(ivf_config(8, 8, 2));
  add_random(idx, 3, "small", rng);
  idx.clear();
  EXPECT_EQ(idx.state(), IndexState::Uninitialized);
  add_random(idx, 50, "big", rng);
  EXPECT_EQ(idx.state(), IndexState::Flat);
}

TEST(ClusteringTest, DedupSkipsCountAgainstTrainingThreshold) {
  std::mt19937 rng(4);
  Index idx(ivf_config(4, 4, 1));
  std::vector<std::vector<float>> vecs;
  std::vector<Metadata> metas;
  for (int i = 0; i < 6; ++i) {
    vecs.push_back(random_unit(4, rng));
    metas.push_back(make_meta("same"));
  }
  // six rows but only one survives dedup
  EXPECT_EQ(idx.add_documents(vecs, metas), 1u);
  EXPECT_EQ(idx.state(), IndexState::Flat);
}

TEST(ClusteringTest, ConfiguredTrainingMinimumIsHonoured) {
  std::mt19937 rng(5);
  auto cfg = ivf_config(8, 4, 2);
  cfg.min_training_samples = 20;
  Index idx(cfg);
  add_random(idx, 10, "d", rng);
  EXPECT_EQ(idx.state(), IndexState::Flat);

  cfg.min_training_samples = 2;
  EXPECT_THROW(Index{cfg}, std::invalid_argument);
}

TEST(ClusteringTest, SingleProbeSearchesOneList) {
  std::mt19937 rng(6);
  const int dim = 8;
  auto vecs = grouped(dim, 4, 10, rng);
  std::vector<Metadata> metas;
  for (size_t i = 0; i < vecs.size(); ++i) metas.push_back(make_meta("g" + std::to_string(i)));

  Index idx(ivf_config(dim, 4, 1));
  ASSERT_EQ(idx.add_documents(vecs, metas), 40u);
  ASSERT_EQ(idx.state(), IndexState::ClusteredTrained);

  auto hits = idx.search(vecs[5], 40);
  ASSERT_FALSE(hits.empty());
  EXPECT_LT(hits.size(), 40u);   // unprobed lists leave empty slots
  EXPECT_EQ(hits[0].meta.id, "g5");
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
}

TEST(ClusterIndexTest, TrainAssignAndSearch) {
  std::mt19937 rng(8);
  const int dim = 8;
  auto vecs = grouped(dim, 4, 25, rng);
  std::vector<float> flat;
  for (auto& v : vecs) flat.insert(flat.end(), v.begin(), v.end());

  ClusterIndex ci(dim, 4, 4);
  EXPECT_FALSE(ci.trained());
  ci.train(flat.data(), vecs.size(), 20, 42);
  ASSERT_TRUE(ci.trained());
  ASSERT_EQ(ci.centroids().size(), 4u * dim);

  // centroids come out unit length
  for (int c = 0; c < 4; ++c) {
    double s = 0.0;
    for (int j = 0; j < dim; ++j) s += ci.centroids()[c * dim + j] * ci.centroids()[c * dim + j];
    EXPECT_NEAR(s, 1.0, 1e-4);
  }

  ci.add(flat.data(), vecs.size(), 0);
  auto res = ci.search(vecs[60].data(), flat.data(), 5);
  ASSERT_EQ(res.size(), 5u);
  EXPECT_EQ(res[0].second, 60);
  for (size_t i = 1; i < res.size(); ++i) EXPECT_LE(res[i].first, res[i - 1].first);
}

TEST(ClusterIndexTest, RestoredCentroidsReproduceSearch) {
  std::mt19937 rng(9);
  const int dim = 8;
  auto vecs = grouped(dim, 4, 10, rng);
  std::vector<float> flat;
  for (auto& v : vecs) flat.insert(flat.end(), v.begin(), v.end());

  ClusterIndex a(dim, 4, 2);
  a.train(flat.data(), vecs.size(), 20, 1);
  a.add(flat.data(), vecs.size(), 0);

  ClusterIndex b(dim, 4, 2);
  b.restore(a.centroids());
  b.add(flat.data(), vecs.size(), 0);

  auto ra = a.search(vecs[13].data(), flat.data(), 6);
  auto rb = b.search(vecs[13].data(), flat.data(), 6);
  ASSERT_EQ(ra.size(), rb.size());
  for (size_t i = 0; i < ra.size(); ++i) {
    EXPECT_EQ(ra[i].second, rb[i].second);
    EXPECT_NEAR(ra[i].first, rb[i].first, 1e-6);
  }

  EXPECT_THROW(b.restore(std::vector<float>(3)), std::invalid_argument);
  EXPECT_THROW(a.train(flat.data(), 2, 5, 1), std::invalid_argument);
}
