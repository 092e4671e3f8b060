#include "embedder.hpp"
#include "errors.hpp"
#include <algorithm>

std::vector<std::vector<float>> EmbeddingProvider::embed_many(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (auto& t : texts) out.push_back(embed_one(t));
  return out;
}

// first 100 characters plus the length
static std::string cache_key(const std::string& text) {
  return text.substr(0, 100) + "_" + std::to_string(text.size());
}

CachingEmbedder::CachingEmbedder(EmbeddingProvider& inner, size_t batch_size, size_t max_size)
  : inner_(inner), batch_size_(std::max<size_t>(1, batch_size)), max_size_(max_size) {}

std::vector<float> CachingEmbedder::embed_one(const std::string& text) {
  return inner_.embed_one(text);
}

std::vector<std::vector<float>> CachingEmbedder::embed_many(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out(texts.size());
  std::vector<size_t> missing;
  for (size_t i = 0; i < texts.size(); ++i) {
    auto it = cache_.find(cache_key(texts[i]));
    if (it != cache_.end()) out[i] = it->second;
    else missing.push_back(i);
  }

  for (size_t b = 0; b < missing.size(); b += batch_size_) {
    size_t e = std::min(missing.size(), b + batch_size_);
    std::vector<std::string> chunk;
    chunk.reserve(e - b);
    for (size_t j = b; j < e; ++j) chunk.push_back(texts[missing[j]]);

    auto vecs = inner_.embed_many(chunk);
    if (vecs.size() != chunk.size())
      throw EmbeddingError("embedding provider returned " + std::to_string(vecs.size()) +
                           " vectors for " + std::to_string(chunk.size()) + " texts");
    for (size_t j = b; j < e; ++j) {
      auto& v = vecs[j - b];
      if ((int)v.size() != inner_.dim())
        throw EmbeddingError("embedding provider returned a vector of dimension " +
                             std::to_string(v.size()));
      put(cache_key(texts[missing[j]]), v);
      out[missing[j]] = std::move(v);
    }
  }
  return out;
}

void CachingEmbedder::put(const std::string& key, const std::vector<float>& v) {
  if (max_size_ == 0 || cache_.count(key)) return;
  if (cache_.size() >= max_size_) {
    // drop the oldest tenth
    size_t drop = std::min(order_.size(), std::max<size_t>(1, max_size_ / 10));
    for (size_t i = 0; i < drop; ++i) {
      cache_.erase(order_.front());
      order_.pop_front();
    }
  }
  cache_.emplace(key, v);
  order_.push_back(key);
}

void CachingEmbedder::clear_cache() {
  cache_.clear();
  order_.clear();
}
