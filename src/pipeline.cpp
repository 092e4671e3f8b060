#include "pipeline.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <sstream>
#include <stdexcept>

static std::string utc_now_iso() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

RetrievalPipeline::RetrievalPipeline(Index& index, EmbeddingProvider& embedder,
                                     const PipelineOptions& opts)
  : index_(index), embedder_(embedder, opts.batch_size, opts.cache_size), opts_(opts) {
  if (embedder.dim() != index.dim())
    throw std::invalid_argument("embedding dimension " + std::to_string(embedder.dim()) +
                                " does not match index dimension " + std::to_string(index.dim()));
}

IngestResult RetrievalPipeline::ingest(const std::vector<QuestionRecord>& records) {
  IngestResult r;
  std::vector<std::string> texts;
  std::vector<Metadata> metas;
  const std::string now = utc_now_iso();

  for (auto& q : records) {
    std::string text = clean_text(q.text);
    if (text.empty()) continue;
    Metadata m;
    m.id = q.id;
    m.source_id = q.id;
    m.text = text;
    m.topic = q.topic;
    m.type = q.type;
    m.marks = q.marks;
    m.paper_id = q.paper_id;
    m.page_number = q.page_number;
    m.main_question_number = q.main_question_number;
    m.sub_question_label = q.sub_question_label;
    m.ingested_at = now;
    texts.push_back(std::move(text));
    metas.push_back(std::move(m));
  }
  r.processed = metas.size();
  r.skipped = records.size() - metas.size();
  ++ingest_calls_;

  if (metas.empty()) {
    spdlog::warn("no valid documents to ingest ({} received)", records.size());
    r.total_size = index_.size();
    return r;
  }

  auto vectors = embedder_.embed_many(texts);
  r.accepted = index_.add_documents(vectors, metas, opts_.deduplicate);
  r.total_size = index_.size();
  documents_ingested_ += r.accepted;
  spdlog::info("ingested {} of {} records, index size {}", r.accepted, records.size(), r.total_size);
  return r;
}

QueryResult RetrievalPipeline::query(const std::string& text, int k,
                                     const std::optional<MetadataFilter>& filter) {
  auto t0 = std::chrono::steady_clock::now();
  QueryResult out;
  out.total_size = index_.size();
  if (out.total_size == 0) return out;

  k = std::max(1, std::min(k, opts_.max_top_k));
  auto qv = embedder_.embed_one(text);
  auto hits = index_.search(qv, k, filter);

  out.results.reserve(hits.size());
  for (auto& h : hits) {
    const Metadata& m = h.meta;
    QueryHit q;
    q.id = m.source_id.empty() ? m.id : m.source_id;
    q.text = m.text;
    q.topic = m.topic;
    q.type = m.type;
    q.marks = m.marks;
    q.paper_id = m.paper_id;
    q.score = std::round((double)h.score * 1e4) / 1e4;
    q.page_number = m.page_number;
    q.main_question_number = m.main_question_number;
    q.sub_question_label = m.sub_question_label;
    out.results.push_back(std::move(q));
  }
  out.query_time_ms = std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - t0).count();
  return out;
}

std::string RetrievalPipeline::context_for_generation(const std::string& text, int k,
                                                      const std::optional<MetadataFilter>& filter) {
  auto res = query(text, k, filter);
  std::ostringstream ss;
  for (size_t i = 0; i < res.results.size(); ++i) {
    const auto& r = res.results[i];
    if (i > 0) ss << "\n\n";
    ss << "[" << (i + 1) << "] Topic: " << r.topic << " | Type: " << r.type << " | Marks: ";
    if (r.marks && *r.marks != 0) ss << *r.marks; else ss << "N/A";
    ss << "\nQuestion: " << r.text;
  }
  return ss.str();
}

PipelineStats RetrievalPipeline::stats() const {
  PipelineStats s;
  s.index = index_.stats();
  s.cache = embedder_.cache_stats();
  s.ingest_calls = ingest_calls_;
  s.documents_ingested = documents_ingested_;
  return s;
}

void RetrievalPipeline::clear_all() {
  index_.clear();
  embedder_.clear_cache();
}
