#pragma once
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Text -> unit-normalized vector of dim() floats. Failures throw EmbeddingError.
class EmbeddingProvider {
public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> embed_one(const std::string& text) = 0;
  virtual std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts);
  virtual int dim() const = 0;
};

// llama.cpp embedding model (GGUF), mean pooled.
class Embedder : public EmbeddingProvider {
public:
  explicit Embedder(const std::string& embed_model_path, int n_ctx = 512);
  ~Embedder() override;

  std::vector<float> embed_one(const std::string& text) override;
  int dim() const override { return dim_; }

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  int dim_;
};

struct CacheStats {
  size_t size;
  size_t max_size;
};

// Serves repeated texts in embed_many from a FIFO cache and forwards the rest
// in batches. embed_one (the query path) always goes to the inner provider.
class CachingEmbedder : public EmbeddingProvider {
public:
  explicit CachingEmbedder(EmbeddingProvider& inner, size_t batch_size = 32,
                           size_t max_size = 1000);

  std::vector<float> embed_one(const std::string& text) override;
  std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) override;
  int dim() const override { return inner_.dim(); }

  void clear_cache();
  CacheStats cache_stats() const { return {cache_.size(), max_size_}; }

private:
  void put(const std::string& key, const std::vector<float>& v);

  EmbeddingProvider& inner_;
  size_t batch_size_;
  size_t max_size_;
  std::unordered_map<std::string, std::vector<float>> cache_;
  std::deque<std::string> order_;   // insertion order, oldest first
};
