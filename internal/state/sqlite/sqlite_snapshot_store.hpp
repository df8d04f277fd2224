#pragma once

#include <memory>

#include "internal/state/snapshot_store.hpp"
#include "sqlite_db.hpp"

namespace rollback::state::sqlite {

/*
  Durable snapshot store backed by a single SQLite table.

  Each call is one autocommit statement; SQLITE_OPEN_FULLMUTEX serializes
  access to the connection.
*/
class SqliteSnapshotStore final : public state::SnapshotStore {
 public:
  explicit SqliteSnapshotStore(std::shared_ptr<SqliteDB> db);

  Result                              Put(const model::StateSnapshot& snapshot) override;
  std::optional<model::StateSnapshot> Get(const std::string& id) override;
  bool                                Remove(const std::string& id) override;

  std::vector<model::StateSnapshot>    List() override;
  std::vector<model::SnapshotMetadata> ListMetadata() override;

 private:
  void          Bootstrap();
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace rollback::state::sqlite
