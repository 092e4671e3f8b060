#pragma once
#include "filters.hpp"
#include <optional>
#include <string>

struct Args {
  std::string mode;          // ingest, query, context, stats, clear
  std::string input;         // records file for ingest, query text otherwise
  std::string index_dir = "./data/indices";
  std::string embed_model = "./models/embed.gguf";
  int dim = 384;
  std::string index_type = "flat";
  int nlist = 100;
  int nprobe = 10;
  int min_train = 0;         // 0 means nlist
  int kmeans_iters = 20;
  int k = 5;
  bool dedup = true;
  int batch_size = 32;
  std::string log_level = "info";
  std::optional<MetadataFilter> filter;
};

Args parse_cli(int argc, char** argv);
