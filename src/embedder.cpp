// src/embedder.cpp
#include "embedder.hpp"
#include "errors.hpp"
#include <llama.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

struct Embedder::Impl {
  llama_model* model = nullptr;
  llama_context* ctx = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx;
  int dim = 0;

  Impl(const std::string& model_path, int n_ctx_) : n_ctx(n_ctx_) {
    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0; // CPU
    model = llama_load_model_from_file(model_path.c_str(), mp);
    if (!model) {
      llama_backend_free();
      throw EmbeddingError("embedder: failed to load model " + model_path);
    }

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.n_ubatch = n_ctx;             // non-causal models need the whole input in one ubatch
    cp.embeddings = true;
    cp.pooling_type = LLAMA_POOLING_TYPE_MEAN;
    ctx = llama_new_context_with_model(model, cp);
    if (!ctx) {
      llama_free_model(model);
      llama_backend_free();
      throw EmbeddingError("embedder: failed to create context");
    }

    vocab = llama_model_get_vocab(model);
    dim = llama_n_embd(model);
    if (dim <= 0) {
      llama_free(ctx);
      llama_free_model(model);
      llama_backend_free();
      throw EmbeddingError("embedder: invalid embedding dim");
    }
  }

  ~Impl() {
    if (ctx) llama_free(ctx);
    if (model) llama_free_model(model);
    llama_backend_free();
  }

  std::vector<llama_token> tokenize(const std::string& text) {
    // first pass for length; a negative count is the required size
    int32_t needed = -llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                                     nullptr, 0, /*add_special=*/true, /*parse_special=*/false);
    if (needed <= 0) throw EmbeddingError("embedder: tokenize failed (len)");
    std::vector<llama_token> toks(needed);
    int32_t n = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                               toks.data(), (int32_t)toks.size(),
                               /*add_special=*/true, /*parse_special=*/false);
    if (n != needed) throw EmbeddingError("embedder: tokenize failed");
    if ((int)toks.size() > n_ctx) toks.resize(n_ctx);
    return toks;
  }

  std::vector<float> encode_text(const std::string& text) {
    auto toks = tokenize(text);

    llama_batch batch = llama_batch_init((int)toks.size(), /*embd*/ 0, /*n_seq*/ 1);
    for (int i = 0; i < (int)toks.size(); ++i) {
      batch.token[i] = toks[i];
      batch.pos[i] = i;
      batch.n_seq_id[i] = 1;
      batch.seq_id[i][0] = 0;
      batch.logits[i] = true;
    }
    batch.n_tokens = (int32_t)toks.size();

    llama_kv_cache_clear(ctx);
    if (llama_decode(ctx, batch) != 0) {
      llama_batch_free(batch);
      throw EmbeddingError("embedder: llama_decode failed");
    }
    llama_batch_free(batch);

    const float* emb = llama_get_embeddings_seq(ctx, 0);
    if (!emb) throw EmbeddingError("embedder: embeddings null");

    std::vector<float> v(emb, emb + dim);
    // L2 normalize
    double s = 0.0; for (float x : v) s += (double)x * (double)x;
    float norm = (float)std::sqrt(std::max(s, 1e-12));
    for (auto& x : v) x /= norm;
    return v;
  }
};

Embedder::Embedder(const std::string& embed_model_path, int n_ctx)
  : impl_(new Impl(embed_model_path, n_ctx)) {
  dim_ = impl_->dim;
  spdlog::info("embedding model loaded: {} (dimension {})", embed_model_path, dim_);
}

Embedder::~Embedder() = default;

std::vector<float> Embedder::embed_one(const std::string& text) {
  return impl_->encode_text(text);
}
