#pragma once
#include "embedder.hpp"
#include "errors.hpp"
#include "metadata.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

inline std::vector<float> unit(std::vector<float> v) {
  double s = 0.0;
  for (float x : v) s += (double)x * x;
  float n = (float)std::sqrt(std::max(s, 1e-12));
  for (auto& x : v) x /= n;
  return v;
}

inline std::vector<float> axis(int dim, int i) {
  std::vector<float> v(dim, 0.0f);
  v[i] = 1.0f;
  return v;
}

inline std::vector<float> random_unit(int dim, std::mt19937& rng) {
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> v(dim);
  for (auto& x : v) x = dist(rng);
  return unit(v);
}

inline Metadata make_meta(const std::string& id, const std::string& topic = "General",
                          std::optional<int> marks = std::nullopt,
                          const std::string& type = "Unknown",
                          const std::string& paper = "paper-1") {
  Metadata m;
  m.id = id;
  m.source_id = id;
  m.text = "question " + id;
  m.topic = topic;
  m.type = type;
  m.marks = marks;
  m.paper_id = paper;
  return m;
}

// Fresh directory under the system temp dir, removed afterwards.
struct TempDir {
  fs::path path;

  TempDir() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = std::string("ragdex_") + info->test_suite_name() + "_" + info->name() +
                       "_" + std::to_string(std::random_device{}());
    path = fs::temp_directory_path() / name;
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  std::string file(const std::string& name) const { return (path / name).string(); }
};

// Hashed bag of words; identical texts give identical vectors.
class FakeEmbedder : public EmbeddingProvider {
public:
  explicit FakeEmbedder(int dim = 32) : dim_(dim) {}

  std::vector<float> embed_one(const std::string& text) override {
    if (fail) throw EmbeddingError("fake embedder failure");
    ++texts_embedded;
    std::vector<float> v(dim_, 0.0f);
    std::string word;
    auto flush = [&]() {
      if (word.empty()) return;
      v[std::hash<std::string>{}(word) % (size_t)dim_] += 1.0f;
      word.clear();
    };
    for (unsigned char c : text) {
      if (std::isalnum(c)) word.push_back((char)std::tolower(c));
      else flush();
    }
    flush();
    if (std::all_of(v.begin(), v.end(), [](float x) { return x == 0.0f; })) v[0] = 1.0f;
    return unit(v);
  }

  std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) override {
    ++batches;
    return EmbeddingProvider::embed_many(texts);
  }

  int dim() const override { return dim_; }

  bool fail = false;
  int texts_embedded = 0;
  int batches = 0;

private:
  int dim_;
};
