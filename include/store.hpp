#pragma once
#include "index_state.hpp"
#include <memory>
#include <optional>
#include <string>

// SQLite persistence for one index. The index structure (kind, dimension,
// centroids) and the per-position rows (metadata, vector, identity) share one
// database and are committed in a single transaction, so a reader sees either
// the previous save or the new one.
class Store {
public:
  explicit Store(const std::string& sqlite_path);
  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  // Writes the rows not yet persisted and replaces the header.
  // Throws PersistenceError.
  void save(const IndexData& d);

  // nullopt when nothing was ever saved. Throws CorruptIndexError when the
  // database is unreadable, inconsistent, or declares another dimension.
  std::optional<IndexData> load(int expected_dim);

  // Closes and deletes the database files. Throws PersistenceError.
  void remove();

  const std::string& path() const { return path_; }

private:
  std::string path_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
