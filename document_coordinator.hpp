// document_coordinator.hpp
#ifndef OT_DOCUMENT_COORDINATOR_HPP
#define OT_DOCUMENT_COORDINATOR_HPP

#include "collaborators.hpp"
#include "document_state.hpp"
#include "ot_config.hpp"
#include "text_operation.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/// Summary of a document's bookkeeping
struct DocumentStats {
  uint64_t version;
  uint64_t oldest_base_version;
  size_t history_size;
  uint64_t length;
  bool poisoned;
};

/// Serialization point for a single document.
///
/// Every call locks the document's own mutex, so submits to one document run
/// strictly one at a time (in lock acquisition order, which defines the version
/// sequence) while other documents are unaffected.
///
/// Error Handling:
/// - InvalidOperation: malformed or out-of-bounds edit, base version in the future
/// - StaleClient: base version older than the retained history
/// - UnknownDocument: the document was closed
/// - InternalInvariantViolation: a rebased operation did not fit the document. The
///   document is poisoned and refuses every submit until reset().
/// A failed submit never modifies the document.
class DocumentCoordinator {
public:
  DocumentCoordinator(std::string document_id, const CoordinatorConfig &config, std::u32string content = {},
                      uint64_t version = 0, BroadcastSink *broadcast = nullptr, SnapshotSink *snapshots = nullptr);

  DocumentCoordinator(const DocumentCoordinator &) = delete;
  DocumentCoordinator &operator=(const DocumentCoordinator &) = delete;

  /// Rebases `operation` from `base_version` onto the current version and applies it.
  ///
  /// Resubmitting an already applied operation id returns the recorded result
  /// without touching the document or broadcasting again.
  ///
  /// @param operation Edit produced by a client against `base_version`
  /// @param base_version Last version the client had seen
  /// @return The rebased operation and the version it produced
  /// @throws InvalidOperation, StaleClient, UnknownDocument, InternalInvariantViolation
  SubmitResult submit(const TextOperation &operation, uint64_t base_version);

  /// Copy of the current content and version (resync path, no transform)
  DocumentSnapshot snapshot() const;

  /// Replaces the document with `content` at `version`, clearing history,
  /// remembered operation ids and any poisoned state.
  /// @throws InvalidOperation if `content` is not valid UTF-8
  void reset(const std::string &content, uint64_t version);

  DocumentStats stats() const;

  /// Marks the document closed and returns its final snapshot. Later submits
  /// throw UnknownDocument.
  DocumentSnapshot close();

  const std::string &document_id() const { return document_id_; }

private:
  SubmitResult apply_locked(const TextOperation &operation, uint64_t base_version);
  void publish_locked(const SubmitResult &result);
  DocumentSnapshot snapshot_locked() const;

  const std::string document_id_;
  const uint64_t snapshot_interval_;
  BroadcastSink *broadcast_;
  SnapshotSink *snapshots_;

  mutable std::mutex mutex_;
  DocumentState state_;
  bool closed_ = false;
};

/// Owns one DocumentCoordinator per document id.
///
/// Constructed once by the embedding process and passed around explicitly.
/// The registry lock only guards the id map; document work runs under the
/// document's own lock, so a slow document never blocks the others.
///
/// Example usage:
/// ```
/// DocumentRegistry registry(CoordinatorConfig::from_env(), &broadcaster, &store);
/// auto result = registry.submit("doc-1", payload, client_version);
/// // result.operation goes to every other session of doc-1
/// ```
class DocumentRegistry {
public:
  /// @throws std::invalid_argument if `config` is invalid
  explicit DocumentRegistry(CoordinatorConfig config = {}, BroadcastSink *broadcast = nullptr,
                            SnapshotSink *snapshots = nullptr);

  DocumentRegistry(const DocumentRegistry &) = delete;
  DocumentRegistry &operator=(const DocumentRegistry &) = delete;

  /// Submits an operation to a document, creating the document first if the
  /// implicit-create policy allows it.
  /// @throws UnknownDocument if the document does not exist and implicit creation is disabled
  SubmitResult submit(const std::string &document_id, const TextOperation &operation, uint64_t base_version);

  /// Wire-form overload
  /// @throws InvalidOperation if the payload is malformed
  SubmitResult submit(const std::string &document_id, const OperationPayload &payload, uint64_t base_version);

  /// Explicitly opens a document, e.g. from a stored snapshot.
  /// @throws InvalidOperation if the document is already open or `content` is not valid UTF-8
  void open_document(const std::string &document_id, const std::string &content = {}, uint64_t version = 0);

  /// @throws UnknownDocument
  DocumentSnapshot get_snapshot(const std::string &document_id) const;

  /// Removes the document and returns its final snapshot for persistence.
  /// @throws UnknownDocument
  DocumentSnapshot close_document(const std::string &document_id);

  /// Manual recovery of a document, typically a poisoned one, from a snapshot.
  /// @throws UnknownDocument
  void reset_document(const DocumentSnapshot &snapshot);

  /// @throws UnknownDocument
  DocumentStats stats(const std::string &document_id) const;

  bool contains(const std::string &document_id) const;
  size_t document_count() const;
  std::vector<std::string> document_ids() const;

  const CoordinatorConfig &config() const { return config_; }

private:
  std::shared_ptr<DocumentCoordinator> find(const std::string &document_id) const;
  std::shared_ptr<DocumentCoordinator> find_or_create(const std::string &document_id);

  const CoordinatorConfig config_;
  BroadcastSink *broadcast_;
  SnapshotSink *snapshots_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<DocumentCoordinator>> documents_;
};

#endif // OT_DOCUMENT_COORDINATOR_HPP
