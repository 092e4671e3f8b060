#include "cli.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "index.hpp"
#include "pipeline.hpp"
#include "records.hpp"
#include "store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

template <typename T>
static json opt(const std::optional<T>& v) {
  return v ? json(*v) : json(nullptr);
}

static json to_json(const QueryResult& r) {
  json results = json::array();
  for (auto& h : r.results) {
    results.push_back({
      {"id", h.id}, {"text", h.text}, {"topic", h.topic}, {"type", h.type},
      {"marks", opt(h.marks)}, {"paper_id", h.paper_id}, {"score", h.score},
      {"page_number", opt(h.page_number)},
      {"main_question_number", opt(h.main_question_number)},
      {"sub_question_label", opt(h.sub_question_label)},
    });
  }
  return {{"results", results}, {"query_time_ms", r.query_time_ms}, {"total_documents", r.total_size}};
}

static json to_json(const IndexStats& s) {
  return {{"total_documents", s.size}, {"index_type", s.index_kind}, {"state", state_name(s.state)},
          {"dimension", s.dim}, {"is_trained", s.trained}, {"nlist", s.nlist}, {"nprobe", s.nprobe}};
}

static IndexConfig index_config(const Args& args) {
  IndexConfig cfg;
  cfg.dim = args.dim;
  auto kind = parse_kind(args.index_type);
  if (!kind) throw std::invalid_argument("unknown index type '" + args.index_type + "'");
  cfg.kind = *kind;
  cfg.nlist = args.nlist;
  cfg.nprobe = args.nprobe;
  cfg.min_training_samples = args.min_train;
  cfg.kmeans_iters = args.kmeans_iters;
  return cfg;
}

static int run(const Args& args) {
  fs::create_directories(args.index_dir);
  auto store = std::make_unique<Store>((fs::path(args.index_dir) / "ragdex.sqlite").string());
  Index index(index_config(args), std::move(store));

  // a wipe must work even when the persisted state does not load
  if (args.mode == "clear") {
    index.clear();
    std::cout << json{{"status", "success"}, {"message", "index cleared"}}.dump(2) << "\n";
    return 0;
  }

  index.load();
  if (args.mode == "stats") {
    std::cout << to_json(index.stats()).dump(2) << "\n";
    return 0;
  }

  Embedder emb(args.embed_model);
  PipelineOptions opts;
  opts.deduplicate = args.dedup;
  opts.batch_size = (size_t)std::max(1, args.batch_size);
  RetrievalPipeline pipeline(index, emb, opts);

  if (args.mode == "ingest") {
    auto records = load_records(args.input);
    auto r = pipeline.ingest(records);
    std::cout << json{{"status", r.processed ? "success" : "warning"},
                      {"documents_ingested", r.accepted},
                      {"documents_processed", r.processed},
                      {"documents_skipped", r.skipped},
                      {"index_size", r.total_size}}.dump(2) << "\n";
    return 0;
  }
  if (args.mode == "query") {
    std::cout << to_json(pipeline.query(args.input, args.k, args.filter)).dump(2) << "\n";
    return 0;
  }
  if (args.mode == "context") {
    std::cout << pipeline.context_for_generation(args.input, args.k, args.filter) << "\n";
    return 0;
  }
  return 1;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);
  spdlog::set_default_logger(spdlog::stderr_color_mt("ragdex"));
  spdlog::set_level(spdlog::level::from_str(args.log_level));

  try {
    return run(args);
  } catch (const CorruptIndexError& e) {
    spdlog::critical("refusing to start on a corrupt index: {}", e.what());
    return 2;
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}
