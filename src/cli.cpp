#include "cli.hpp"
#include <iostream>
#include <cstdlib>
#include <stdexcept>

static const char* USAGE =
"ragdex ingest <records.json> [--index-dir dir] [--embed-model path] [--dim N] [--index-type flat|ivf]\n"
"              [--nlist N] [--nprobe N] [--min-train N] [--kmeans-iters N] [--batch-size N] [--no-dedup]\n"
"ragdex query \"text\" [-k N] [--topic T]... [--type T]... [--paper ID]... [--min-marks N] [--max-marks N]\n"
"              [--regex RE]... [--index-dir dir] [--embed-model path] [--dim N]\n"
"ragdex context \"text\" (same flags as query)\n"
"ragdex stats [--index-dir dir] [--dim N]\n"
"ragdex clear [--index-dir dir] [--dim N]\n"
"common: [--log-level trace|debug|info|warn|error|off]\n";

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) { std::cerr << USAGE; std::exit(1); }
  a.mode = argv[1];
  int i = 2;
  if (a.mode == "ingest" || a.mode == "query" || a.mode == "context") {
    if (i >= argc) { std::cerr << USAGE; std::exit(1); }
    a.input = argv[i++];
  } else if (a.mode != "stats" && a.mode != "clear") {
    std::cerr << USAGE; std::exit(1);
  }

  auto filter = [&]() -> MetadataFilter& {
    if (!a.filter) a.filter.emplace();
    return *a.filter;
  };

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    auto next_int = [&]() {
      std::string v; next(v);
      try { return std::stoi(v); }
      catch (const std::exception&) { std::cerr << "Expected a number after " << f << "\n"; std::exit(1); }
    };

    if (f == "--index-dir") next(a.index_dir);
    else if (f == "--embed-model") next(a.embed_model);
    else if (f == "--dim") a.dim = next_int();
    else if (f == "--index-type") next(a.index_type);
    else if (f == "--nlist") a.nlist = next_int();
    else if (f == "--nprobe") a.nprobe = next_int();
    else if (f == "--min-train") a.min_train = next_int();
    else if (f == "--kmeans-iters") a.kmeans_iters = next_int();
    else if (f == "--batch-size") a.batch_size = next_int();
    else if (f == "--no-dedup") a.dedup = false;
    else if (f == "--log-level") next(a.log_level);
    else if (f == "-k") a.k = next_int();
    else if (f == "--topic") { std::string v; next(v); filter().topics.push_back(v); }
    else if (f == "--type") { std::string v; next(v); filter().types.push_back(v); }
    else if (f == "--paper") { std::string v; next(v); filter().paper_ids.push_back(v); }
    else if (f == "--regex") { std::string v; next(v); filter().text_patterns.push_back(v); }
    else if (f == "--min-marks") filter().min_marks = next_int();
    else if (f == "--max-marks") filter().max_marks = next_int();
    else { std::cerr << "Unknown flag: " << f << "\n"; std::exit(1); }
  }
  return a;
}
