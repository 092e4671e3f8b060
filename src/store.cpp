#include "store.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
const int kFormatVersion = 1;

struct SqliteError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

SqliteError sqlite_error(sqlite3* db, const std::string& what) {
  return SqliteError(what + ": " + (db ? sqlite3_errmsg(db) : "out of memory"));
}

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string e = err ? err : "unknown";
    sqlite3_free(err);
    throw SqliteError(std::string("sqlite exec: ") + e);
  }
}

struct Stmt {
  sqlite3* db;
  sqlite3_stmt* st = nullptr;

  Stmt(sqlite3* db_, const char* sql) : db(db_) {
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
      throw sqlite_error(db, "sqlite prepare");
  }
  ~Stmt() { sqlite3_finalize(st); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  bool row() {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw sqlite_error(db, "sqlite step");
  }
  void run() {
    if (sqlite3_step(st) != SQLITE_DONE) throw sqlite_error(db, "sqlite write");
    sqlite3_reset(st);
    sqlite3_clear_bindings(st);
  }

  void bind(int i, const std::string& s) { sqlite3_bind_text(st, i, s.data(), (int)s.size(), SQLITE_TRANSIENT); }
  void bind(int i, int64_t v) { sqlite3_bind_int64(st, i, (sqlite3_int64)v); }
  void bind(int i, const std::optional<int>& v) {
    if (v) sqlite3_bind_int(st, i, *v); else sqlite3_bind_null(st, i);
  }
  void bind(int i, const std::optional<std::string>& v) {
    if (v) bind(i, *v); else sqlite3_bind_null(st, i);
  }
  void bind_floats(int i, const float* p, size_t n) {
    if (n == 0) sqlite3_bind_null(st, i);
    else sqlite3_bind_blob(st, i, p, (int)(n * sizeof(float)), SQLITE_STATIC);
  }

  bool null(int i) const { return sqlite3_column_type(st, i) == SQLITE_NULL; }
  int64_t i64(int i) const { return (int64_t)sqlite3_column_int64(st, i); }
  std::string text(int i) const {
    auto p = reinterpret_cast<const char*>(sqlite3_column_text(st, i));
    return p ? std::string(p, (size_t)sqlite3_column_bytes(st, i)) : std::string();
  }
  std::optional<int> opt_int(int i) const {
    if (null(i)) return std::nullopt;
    return sqlite3_column_int(st, i);
  }
  std::optional<std::string> opt_text(int i) const {
    if (null(i)) return std::nullopt;
    return text(i);
  }
  // false when the blob does not hold exactly n floats
  bool floats(int i, float* out, size_t n) const {
    const void* p = sqlite3_column_blob(st, i);
    size_t bytes = (size_t)sqlite3_column_bytes(st, i);
    if (bytes != n * sizeof(float) || (n > 0 && !p)) return false;
    if (n > 0) std::memcpy(out, p, bytes);
    return true;
  }
};

const char* kSchema =
  "CREATE TABLE IF NOT EXISTS index_header ("
  " id INTEGER PRIMARY KEY CHECK (id = 0),"
  " format_version INTEGER NOT NULL,"
  " index_kind TEXT NOT NULL,"
  " dimension INTEGER NOT NULL,"
  " size INTEGER NOT NULL,"
  " nlist INTEGER NOT NULL,"
  " nprobe INTEGER NOT NULL,"
  " centroids BLOB"
  ");"
  "CREATE TABLE IF NOT EXISTS records ("
  " position INTEGER PRIMARY KEY,"
  " id TEXT NOT NULL,"
  " source_id TEXT NOT NULL,"
  " text TEXT NOT NULL,"
  " topic TEXT NOT NULL,"
  " type TEXT NOT NULL,"
  " marks INTEGER,"
  " paper_id TEXT NOT NULL,"
  " page_number INTEGER,"
  " main_question_number TEXT,"
  " sub_question_label TEXT,"
  " ingested_at TEXT NOT NULL,"
  " embedding BLOB NOT NULL"
  ");"
  "CREATE TABLE IF NOT EXISTS identity ("
  " external_id TEXT PRIMARY KEY,"
  " position INTEGER NOT NULL"
  ");";

bool table_exists(sqlite3* db, const char* name) {
  Stmt st(db, "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?");
  st.bind(1, std::string(name));
  return st.row();
}

int64_t count_rows(sqlite3* db, const char* sql) {
  Stmt st(db, sql);
  return st.row() ? st.i64(0) : 0;
}
}  // namespace

struct Store::Impl {
  sqlite3* db = nullptr;

  ~Impl() { close(); }

  sqlite3* open(const std::string& path) {
    if (db) return db;
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
      SqliteError e = sqlite_error(db, "sqlite open " + path);
      close();
      throw e;
    }
    exec(db, "PRAGMA synchronous=FULL;");
    return db;
  }

  void close() {
    if (db) sqlite3_close(db);
    db = nullptr;
  }
};

Store::Store(const std::string& sqlite_path) : path_(sqlite_path), impl_(new Impl) {}

Store::~Store() = default;

static void write_rows(sqlite3* db, const IndexData& d) {
  exec(db, kSchema);

  const int64_t n = (int64_t)d.size();
  int64_t persisted = count_rows(db, "SELECT COUNT(*) FROM records");
  bool same_dim = true;
  {
    Stmt st(db, "SELECT dimension FROM index_header WHERE id = 0");
    if (st.row()) same_dim = st.i64(0) == d.dim;
  }
  if (persisted > n || !same_dim) {
    exec(db, "DELETE FROM records; DELETE FROM identity;");
    persisted = 0;
  }

  Stmt ins(db,
    "INSERT INTO records (position, id, source_id, text, topic, type, marks, paper_id,"
    " page_number, main_question_number, sub_question_label, ingested_at, embedding)"
    " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
  for (int64_t pos = persisted; pos < n; ++pos) {
    const Metadata& m = d.meta.get(pos);
    ins.bind(1, pos);
    ins.bind(2, m.id);
    ins.bind(3, m.source_id);
    ins.bind(4, m.text);
    ins.bind(5, m.topic);
    ins.bind(6, m.type);
    ins.bind(7, m.marks);
    ins.bind(8, m.paper_id);
    ins.bind(9, m.page_number);
    ins.bind(10, m.main_question_number);
    ins.bind(11, m.sub_question_label);
    ins.bind(12, m.ingested_at);
    ins.bind_floats(13, d.vectors.data() + pos * d.dim, (size_t)d.dim);
    ins.run();
  }

  // identity values only ever move to newer positions
  Stmt ids(db, "INSERT OR REPLACE INTO identity (external_id, position) VALUES (?, ?)");
  for (auto& kv : d.meta.identity()) {
    if (kv.second < persisted) continue;
    ids.bind(1, kv.first);
    ids.bind(2, kv.second);
    ids.run();
  }

  Stmt hdr(db,
    "INSERT OR REPLACE INTO index_header (id, format_version, index_kind, dimension, size,"
    " nlist, nprobe, centroids) VALUES (0, ?, ?, ?, ?, ?, ?, ?)");
  bool clustered = d.state == IndexState::ClusteredTrained;
  hdr.bind(1, (int64_t)kFormatVersion);
  hdr.bind(2, std::string(kind_name(clustered ? IndexKind::Ivf : IndexKind::Flat)));
  hdr.bind(3, (int64_t)d.dim);
  hdr.bind(4, n);
  hdr.bind(5, (int64_t)(clustered ? d.nlist : 0));
  hdr.bind(6, (int64_t)(clustered ? d.nprobe : 0));
  if (clustered) hdr.bind_floats(7, d.centroids.data(), d.centroids.size());
  else hdr.bind_floats(7, nullptr, 0);
  hdr.run();
}

void Store::save(const IndexData& d) {
  if (d.state == IndexState::Uninitialized || d.state == IndexState::ClusteredUntrained)
    throw PersistenceError(std::string("cannot persist an index in state ") + state_name(d.state));
  try {
    sqlite3* db = impl_->open(path_);
    exec(db, "BEGIN IMMEDIATE;");
    try {
      write_rows(db, d);
      exec(db, "COMMIT;");
    } catch (...) {
      if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
        spdlog::warn("rollback on {} failed: {}", path_, sqlite3_errmsg(db));
      throw;
    }
  } catch (const SqliteError& e) {
    spdlog::error("saving index to {} failed: {}", path_, e.what());
    throw PersistenceError("save " + path_ + ": " + e.what());
  }
}

static std::optional<IndexData> read_index(sqlite3* db, int expected_dim) {
  bool has_header = table_exists(db, "index_header");
  bool has_records = table_exists(db, "records");
  bool has_identity = table_exists(db, "identity");
  if (!has_header && !has_records && !has_identity) return std::nullopt;
  if (!has_header || !has_records || !has_identity)
    throw CorruptIndexError("index database is missing tables");

  int64_t rows = count_rows(db, "SELECT COUNT(*) FROM records");
  Stmt hdr(db,
    "SELECT format_version, index_kind, dimension, size, nlist, nprobe, centroids"
    " FROM index_header WHERE id = 0");
  if (!hdr.row()) {
    if (rows == 0) return std::nullopt;
    throw CorruptIndexError("records present without an index header");
  }

  if (hdr.i64(0) != kFormatVersion)
    throw CorruptIndexError("unsupported format version " + std::to_string(hdr.i64(0)));
  auto kind = parse_kind(hdr.text(1));
  if (!kind) throw CorruptIndexError("unknown index kind '" + hdr.text(1) + "'");
  if (hdr.i64(2) != expected_dim)
    throw CorruptIndexError("declared dimension " + std::to_string(hdr.i64(2)) +
                            " does not match embedding dimension " + std::to_string(expected_dim));
  int64_t size = hdr.i64(3);
  if (size != rows)
    throw CorruptIndexError("header declares " + std::to_string(size) + " rows, found " +
                            std::to_string(rows));

  IndexData d;
  d.dim = expected_dim;
  if (*kind == IndexKind::Ivf) {
    d.state = IndexState::ClusteredTrained;
    d.nlist = (int)hdr.i64(4);
    d.nprobe = (int)hdr.i64(5);
    if (d.nlist <= 0 || d.nprobe <= 0 || d.nprobe > d.nlist)
      throw CorruptIndexError("bad cluster parameters");
    d.centroids.resize((size_t)d.nlist * d.dim);
    if (!hdr.floats(6, d.centroids.data(), d.centroids.size()))
      throw CorruptIndexError("centroid block has the wrong size");
  } else {
    d.state = IndexState::Flat;
  }

  d.vectors.resize((size_t)size * d.dim);
  Stmt rec(db,
    "SELECT position, id, source_id, text, topic, type, marks, paper_id, page_number,"
    " main_question_number, sub_question_label, ingested_at, embedding"
    " FROM records ORDER BY position");
  int64_t expect = 0;
  while (rec.row()) {
    if (rec.i64(0) != expect)
      throw CorruptIndexError("gap in record positions at " + std::to_string(expect));
    Metadata m;
    m.id = rec.text(1);
    m.source_id = rec.text(2);
    m.text = rec.text(3);
    m.topic = rec.text(4);
    m.type = rec.text(5);
    m.marks = rec.opt_int(6);
    m.paper_id = rec.text(7);
    m.page_number = rec.opt_int(8);
    m.main_question_number = rec.opt_text(9);
    m.sub_question_label = rec.opt_text(10);
    m.ingested_at = rec.text(11);
    if (!rec.floats(12, d.vectors.data() + expect * d.dim, (size_t)d.dim))
      throw CorruptIndexError("vector at position " + std::to_string(expect) + " has the wrong size");
    d.meta.append(std::move(m));
    ++expect;
  }

  Stmt ids(db, "SELECT external_id, position FROM identity");
  while (ids.row()) {
    int64_t pos = ids.i64(1);
    if (pos < 0 || pos >= size)
      throw CorruptIndexError("identity entry points at position " + std::to_string(pos));
    d.meta.register_id(ids.text(0), pos);
  }

  return d;
}

std::optional<IndexData> Store::load(int expected_dim) {
  if (!fs::exists(path_)) return std::nullopt;
  try {
    auto d = read_index(impl_->open(path_), expected_dim);
    if (!d) spdlog::warn("index database {} holds no committed index", path_);
    return d;
  } catch (const CorruptIndexError& e) {
    spdlog::error("index at {} is corrupt: {}", path_, e.what());
    throw;
  } catch (const SqliteError& e) {
    spdlog::error("index at {} is unreadable: {}", path_, e.what());
    throw CorruptIndexError("load " + path_ + ": " + e.what());
  }
}

void Store::remove() {
  impl_->close();
  for (const char* suffix : {"", "-journal", "-wal", "-shm"}) {
    std::error_code ec;
    fs::remove(path_ + suffix, ec);
    if (ec) throw PersistenceError("remove " + path_ + suffix + ": " + ec.message());
  }
}
