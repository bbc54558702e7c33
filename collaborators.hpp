// collaborators.hpp
// Boundary types shared with the session layer and the storage collaborator.
#ifndef OT_COLLABORATORS_HPP
#define OT_COLLABORATORS_HPP

#include "text_operation.hpp"

#include <cstdint>
#include <string>

/// Point-in-time copy of a document. Never shares storage with the live state.
struct DocumentSnapshot {
  std::string document_id;
  std::string content; // UTF-8
  uint64_t version = 0;

  bool operator==(const DocumentSnapshot &other) const = default;
};

/// Outcome of a successful submit
struct SubmitResult {
  TextOperation operation; // Rebased operation, to be broadcast verbatim
  uint64_t version;        // Version produced by the operation
  bool duplicate = false;  // True if the operation id had already been applied
};

/// Receives every newly applied operation, in version order, for fan-out to
/// other sessions. Called with the document lock held: implementations must
/// not call back into the same document.
class BroadcastSink {
public:
  virtual ~BroadcastSink() = default;
  virtual void on_applied(const std::string &document_id, const TextOperation &operation, uint64_t version) = 0;
};

/// Receives periodic snapshots for durable storage.
class SnapshotSink {
public:
  virtual ~SnapshotSink() = default;
  virtual void on_snapshot(const DocumentSnapshot &snapshot) = 0;
};

#endif // OT_COLLABORATORS_HPP
