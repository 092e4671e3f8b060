#pragma once
#include "embedder.hpp"
#include "index.hpp"
#include "records.hpp"
#include <optional>
#include <string>
#include <vector>

struct IngestResult {
  size_t accepted = 0;     // rows appended after dedup
  size_t processed = 0;    // records with non-empty text
  size_t skipped = 0;      // records dropped before embedding
  size_t total_size = 0;
};

struct QueryHit {
  std::string id;
  std::string text;
  std::string topic;
  std::string type;
  std::optional<int> marks;
  std::string paper_id;
  double score;            // rounded to 4 decimals
  std::optional<int> page_number;
  std::optional<std::string> main_question_number;
  std::optional<std::string> sub_question_label;
};

struct QueryResult {
  std::vector<QueryHit> results;
  size_t total_size = 0;
  double query_time_ms = 0.0;
};

struct PipelineStats {
  IndexStats index;
  CacheStats cache;
  size_t ingest_calls = 0;
  size_t documents_ingested = 0;
};

struct PipelineOptions {
  bool deduplicate = true;
  size_t batch_size = 32;
  size_t cache_size = 1000;
  int max_top_k = 50;
};

// Sequences embedding and index calls. Both collaborators are owned by the
// caller and must outlive the pipeline.
class RetrievalPipeline {
public:
  RetrievalPipeline(Index& index, EmbeddingProvider& embedder,
                    const PipelineOptions& opts = PipelineOptions());

  // Throws EmbeddingError, PersistenceError.
  IngestResult ingest(const std::vector<QuestionRecord>& records);

  // k is clamped to [1, max_top_k].
  QueryResult query(const std::string& text, int k = 5,
                    const std::optional<MetadataFilter>& filter = std::nullopt);

  // Numbered "[i] Topic | Type | Marks" blocks for a generation prompt;
  // empty when nothing matches.
  std::string context_for_generation(const std::string& text, int k = 5,
                                     const std::optional<MetadataFilter>& filter = std::nullopt);

  PipelineStats stats() const;
  void clear_all();

private:
  Index& index_;
  CachingEmbedder embedder_;
  PipelineOptions opts_;
  size_t ingest_calls_ = 0;
  size_t documents_ingested_ = 0;
};
