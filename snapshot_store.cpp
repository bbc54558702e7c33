// snapshot_store.cpp
#include "snapshot_store.hpp"

#include <cstdio>

SQLiteSnapshotStore::SQLiteSnapshotStore(const char *path) : db_(nullptr) {
  int rc = sqlite3_open_v2(path, &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string error = "Failed to open database: " + std::string(db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw SnapshotStoreException(error);
  }

  try {
    exec_or_throw("PRAGMA journal_mode=WAL");
    exec_or_throw("CREATE TABLE IF NOT EXISTS ot_snapshots ("
                  "document_id TEXT NOT NULL, "
                  "version INTEGER NOT NULL, "
                  "content TEXT NOT NULL, "
                  "PRIMARY KEY (document_id, version))");
  } catch (...) {
    sqlite3_close(db_);
    throw;
  }
}

SQLiteSnapshotStore::~SQLiteSnapshotStore() {
  if (db_) {
    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
      // Log error but don't throw from destructor
      std::fprintf(stderr, "[ot-lite] failed to close snapshot store: %s\n", sqlite3_errmsg(db_));
    }
  }
}

void SQLiteSnapshotStore::save(const DocumentSnapshot &snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(prepare("INSERT OR REPLACE INTO ot_snapshots (document_id, version, content) VALUES (?, ?, ?)"));
  sqlite3_bind_text(stmt.get(), 1, snapshot.document_id.c_str(), static_cast<int>(snapshot.document_id.size()),
                    SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(snapshot.version));
  sqlite3_bind_text(stmt.get(), 3, snapshot.content.c_str(), static_cast<int>(snapshot.content.size()),
                    SQLITE_TRANSIENT);
  step_done(stmt, "save snapshot");
}

std::optional<DocumentSnapshot> SQLiteSnapshotStore::load_latest(const std::string &document_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(prepare("SELECT version, content FROM ot_snapshots WHERE document_id = ? "
                         "ORDER BY version DESC LIMIT 1"));
  sqlite3_bind_text(stmt.get(), 1, document_id.c_str(), static_cast<int>(document_id.size()), SQLITE_TRANSIENT);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    throw SnapshotStoreException("Failed to load snapshot: " + get_error());
  }

  DocumentSnapshot snapshot;
  snapshot.document_id = document_id;
  snapshot.version = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
  const unsigned char *text = sqlite3_column_text(stmt.get(), 1);
  int bytes = sqlite3_column_bytes(stmt.get(), 1);
  if (text) {
    snapshot.content.assign(reinterpret_cast<const char *>(text), static_cast<size_t>(bytes));
  }
  return snapshot;
}

std::vector<std::string> SQLiteSnapshotStore::list_documents() const {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(prepare("SELECT DISTINCT document_id FROM ot_snapshots ORDER BY document_id"));
  std::vector<std::string> ids;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    ids.emplace_back(reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 0)));
  }
  if (rc != SQLITE_DONE) {
    throw SnapshotStoreException("Failed to list documents: " + get_error());
  }
  return ids;
}

size_t SQLiteSnapshotStore::prune(const std::string &document_id, size_t keep) {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(prepare("DELETE FROM ot_snapshots WHERE document_id = ?1 AND version NOT IN "
                         "(SELECT version FROM ot_snapshots WHERE document_id = ?1 "
                         "ORDER BY version DESC LIMIT ?2)"));
  sqlite3_bind_text(stmt.get(), 1, document_id.c_str(), static_cast<int>(document_id.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(keep));
  step_done(stmt, "prune snapshots");
  return static_cast<size_t>(sqlite3_changes(db_));
}

size_t SQLiteSnapshotStore::snapshot_count(const std::string &document_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(prepare("SELECT COUNT(*) FROM ot_snapshots WHERE document_id = ?"));
  sqlite3_bind_text(stmt.get(), 1, document_id.c_str(), static_cast<int>(document_id.size()), SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    throw SnapshotStoreException("Failed to count snapshots: " + get_error());
  }
  return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

sqlite3_stmt *SQLiteSnapshotStore::prepare(const char *sql) const {
  sqlite3_stmt *stmt;
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw SnapshotStoreException("Failed to prepare statement: " + get_error());
  }
  return stmt;
}

void SQLiteSnapshotStore::exec_or_throw(const char *sql) {
  char *err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = "SQL execution failed: ";
    if (err_msg) {
      error += err_msg;
      sqlite3_free(err_msg);
    }
    throw SnapshotStoreException(error);
  }
}

void SQLiteSnapshotStore::step_done(const Statement &stmt, const char *what) {
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw SnapshotStoreException(std::string("Failed to ") + what + ": " + get_error());
  }
}

std::string SQLiteSnapshotStore::get_error() const { return sqlite3_errmsg(db_); }
