// snapshot_store.hpp
#ifndef OT_SNAPSHOT_STORE_HPP
#define OT_SNAPSHOT_STORE_HPP

#include "collaborators.hpp"

#include <sqlite3.h>

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/// Exception thrown for snapshot storage errors
class SnapshotStoreException : public std::runtime_error {
public:
  explicit SnapshotStoreException(const std::string &msg) : std::runtime_error(msg) {}
};

/// SQLite-backed store for document snapshots.
///
/// Reference implementation of the storage collaborator: it receives snapshots
/// through the SnapshotSink interface and hands back the latest one when a
/// document is reopened.
///
/// Example usage:
/// ```
/// SQLiteSnapshotStore store("snapshots.db");
/// DocumentRegistry registry(config, nullptr, &store);
/// ...
/// if (auto snap = store.load_latest("doc-1")) {
///   registry.open_document(snap->document_id, snap->content, snap->version);
/// }
/// ```
///
/// Thread Safety:
/// Safe to share across threads; every call is serialized on an internal mutex.
class SQLiteSnapshotStore : public SnapshotSink {
public:
  /// Opens (or creates) the database at `path` and ensures the schema exists
  ///
  /// @param path Database file, or ":memory:"
  /// @throws SnapshotStoreException if the database cannot be opened
  explicit SQLiteSnapshotStore(const char *path);

  ~SQLiteSnapshotStore() override;

  // Disable copy (sqlite3* is not copyable)
  SQLiteSnapshotStore(const SQLiteSnapshotStore &) = delete;
  SQLiteSnapshotStore &operator=(const SQLiteSnapshotStore &) = delete;

  /// Stores a snapshot. Storing the same (document, version) twice overwrites.
  /// @throws SnapshotStoreException on SQL failure
  void save(const DocumentSnapshot &snapshot);

  /// SnapshotSink entry point, same as save()
  void on_snapshot(const DocumentSnapshot &snapshot) override { save(snapshot); }

  /// Latest stored snapshot of a document, if any
  /// @throws SnapshotStoreException on SQL failure
  std::optional<DocumentSnapshot> load_latest(const std::string &document_id) const;

  /// Ids of all documents with at least one snapshot, sorted
  std::vector<std::string> list_documents() const;

  /// Deletes all but the `keep` most recent snapshots of a document
  /// @return Number of snapshots removed
  size_t prune(const std::string &document_id, size_t keep);

  /// Number of snapshots stored for a document
  size_t snapshot_count(const std::string &document_id) const;

private:
  /// RAII wrapper for sqlite3_stmt
  class Statement {
  public:
    explicit Statement(sqlite3_stmt *stmt) : stmt_(stmt) {}
    ~Statement() {
      if (stmt_)
        sqlite3_finalize(stmt_);
    }
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;
    sqlite3_stmt *get() const { return stmt_; }

  private:
    sqlite3_stmt *stmt_;
  };

  /// Prepares a statement
  /// @throws SnapshotStoreException if preparation fails
  sqlite3_stmt *prepare(const char *sql) const;

  /// Helper to execute SQL and check for errors
  void exec_or_throw(const char *sql);

  /// Steps a write statement to completion
  void step_done(const Statement &stmt, const char *what);

  /// Helper to get error message
  std::string get_error() const;

  sqlite3 *db_;
  mutable std::mutex mutex_;
};

#endif // OT_SNAPSHOT_STORE_HPP
