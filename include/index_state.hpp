#pragma once
#include "metadata.hpp"
#include <optional>
#include <string>
#include <vector>

enum class IndexState { Uninitialized, Flat, ClusteredUntrained, ClusteredTrained };
enum class IndexKind { Flat, Ivf };

const char* state_name(IndexState s);
const char* kind_name(IndexKind k);
std::optional<IndexKind> parse_kind(const std::string& s);

// Everything that is persisted for one index.
struct IndexData {
  IndexState state = IndexState::Uninitialized;
  int dim = 0;
  int nlist = 0;
  int nprobe = 0;
  std::vector<float> centroids;   // nlist * dim, only when clustered
  std::vector<float> vectors;     // size * dim, row-major by position
  MetadataStore meta;

  size_t size() const { return meta.size(); }
};
