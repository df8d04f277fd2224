#include "sqlite_snapshot_store.hpp"

#include <stdexcept>

namespace rollback::state::sqlite {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static model::SnapshotMetadata ReadMetadata(sqlite3_stmt* st) {
  model::SnapshotMetadata m;
  m.id          = ColText(st, 0);
  m.created_at  = util::FromUnixMillis(ColU64(st, 1));
  m.type        = static_cast<model::SnapshotType>(sqlite3_column_int(st, 2));
  m.checksum    = ColText(st, 3);
  m.size_bytes  = ColU64(st, 4);
  m.compression = ColText(st, 5);
  return m;
}

static model::StateSnapshot ReadSnapshot(sqlite3_stmt* st) {
  const auto          m = ReadMetadata(st);
  model::StateSnapshot s;
  s.id          = m.id;
  s.created_at  = m.created_at;
  s.type        = m.type;
  s.checksum    = m.checksum;
  s.size_bytes  = m.size_bytes;
  s.compression = m.compression;
  s.data        = ColBlob(st, 6);
  return s;
}

SqliteSnapshotStore::SqliteSnapshotStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  if (!db_) throw std::invalid_argument("SqliteSnapshotStore requires a database");
  Bootstrap();
}

void SqliteSnapshotStore::Bootstrap() {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS snapshots ("
      "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
      "id TEXT NOT NULL UNIQUE, "
      "created_at_ms INTEGER NOT NULL, "
      "type INTEGER NOT NULL, "
      "checksum TEXT NOT NULL, "
      "size_bytes INTEGER NOT NULL, "
      "compression TEXT NOT NULL, "
      "data BLOB NOT NULL);");

  db_->Exec("SELECT id,created_at_ms,type,checksum,size_bytes,compression,data FROM snapshots LIMIT 1;");
}

Result SqliteSnapshotStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteSnapshotStore::Put(const model::StateSnapshot& s) {
  if (s.id.empty()) return Result::Err(ErrorCode::InternalError, "snapshot id is empty");

  auto* db = db_->Handle();

  const char* sql =
      "INSERT INTO snapshots(id,created_at_ms,type,checksum,size_bytes,compression,data) VALUES(?,?,?,?,?,?,?) "
      "ON CONFLICT(id) DO UPDATE SET created_at_ms=excluded.created_at_ms, type=excluded.type, checksum=excluded.checksum, "
      "size_bytes=excluded.size_bytes, compression=excluded.compression, data=excluded.data;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  BindText(st.get(), 1, s.id);
  BindU64(st.get(), 2, util::ToUnixMillis(s.created_at));
  sqlite3_bind_int(st.get(), 3, static_cast<int>(s.type));
  BindText(st.get(), 4, s.checksum);
  BindU64(st.get(), 5, s.size_bytes);
  BindText(st.get(), 6, s.compression);
  BindBlob(st.get(), 7, s.data);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::StateSnapshot> SqliteSnapshotStore::Get(const std::string& id) {
  Statement st(db_->Prepare("SELECT id,created_at_ms,type,checksum,size_bytes,compression,data FROM snapshots WHERE id=?;"));
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error("sqlite snapshot read: " + Translate(db_->Handle(), rc).message);

  return ReadSnapshot(st.get());
}

bool SqliteSnapshotStore::Remove(const std::string& id) {
  Statement st(db_->Prepare("DELETE FROM snapshots WHERE id=?;"));
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite snapshot delete: " + Translate(db_->Handle(), rc).message);

  return sqlite3_changes(db_->Handle()) > 0;
}

std::vector<model::StateSnapshot> SqliteSnapshotStore::List() {
  Statement st(db_->Prepare("SELECT id,created_at_ms,type,checksum,size_bytes,compression,data FROM snapshots ORDER BY seq;"));

  std::vector<model::StateSnapshot> out;
  int                               rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadSnapshot(st.get()));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite snapshot list: " + Translate(db_->Handle(), rc).message);
  return out;
}

std::vector<model::SnapshotMetadata> SqliteSnapshotStore::ListMetadata() {
  Statement st(db_->Prepare("SELECT id,created_at_ms,type,checksum,size_bytes,compression FROM snapshots ORDER BY seq;"));

  std::vector<model::SnapshotMetadata> out;
  int                                  rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadMetadata(st.get()));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite snapshot list: " + Translate(db_->Handle(), rc).message);
  return out;
}

} // namespace rollback::state::sqlite
