// document_coordinator.cpp
#include "document_coordinator.hpp"
#include "transform.hpp"
#include "utf8.hpp"

#include <cstdio>

// DocumentCoordinator implementation

DocumentCoordinator::DocumentCoordinator(std::string document_id, const CoordinatorConfig &config,
                                         std::u32string content, uint64_t version, BroadcastSink *broadcast,
                                         SnapshotSink *snapshots)
    : document_id_(std::move(document_id)), snapshot_interval_(config.snapshot_interval), broadcast_(broadcast),
      snapshots_(snapshots), state_(config.history_limit, config.dedup_limit, std::move(content), version) {}

SubmitResult DocumentCoordinator::submit(const TextOperation &operation, uint64_t base_version) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (closed_) {
    throw UnknownDocument(document_id_);
  }
  if (state_.poisoned()) {
    throw InternalInvariantViolation("Document '" + document_id_ +
                                     "' refuses mutation until reset: " + state_.poison_reason());
  }

  // Client retries are answered from the record, even if their base version
  // has since fallen out of the history window.
  if (auto recorded = state_.find_applied(operation.operation_id())) {
    return SubmitResult{recorded->operation, recorded->version, true};
  }

  SubmitResult result = apply_locked(operation, base_version);
  publish_locked(result);
  return result;
}

SubmitResult DocumentCoordinator::apply_locked(const TextOperation &operation, uint64_t base_version) {
  if (base_version > state_.version()) {
    throw InvalidOperation("Base version " + std::to_string(base_version) + " is ahead of document '" + document_id_ +
                           "' (version " + std::to_string(state_.version()) + ")");
  }
  if (!state_.can_rebase_from(base_version)) {
    throw StaleClient(base_version, state_.oldest_base_version(), state_.version());
  }

  // Bounds are checked against the document the client saw.
  operation.validate_against(state_.length_at(base_version));

  TextOperation rebased = rebase(operation, state_.entries_after(base_version), state_.history().end(),
                                 [](const HistoryEntry &entry) -> const TextOperation & { return entry.operation; });

  try {
    rebased.validate_against(state_.length());
  } catch (const InvalidOperation &e) {
    std::string reason = "rebased " + rebased.to_string() + " from base version " + std::to_string(base_version) +
                         " does not fit version " + std::to_string(state_.version()) + ": " + e.what();
    std::fprintf(stderr, "[ot-lite] FATAL: document '%s' poisoned: %s\n", document_id_.c_str(), reason.c_str());
    state_.poison(reason);
    throw InternalInvariantViolation("Document '" + document_id_ + "': " + reason);
  }

  uint64_t version = state_.apply(rebased);
  return SubmitResult{std::move(rebased), version, false};
}

void DocumentCoordinator::publish_locked(const SubmitResult &result) {
  // The operation is applied at this point; sink failures are reported but
  // must not turn a committed edit into an error for the submitter.
  if (broadcast_) {
    try {
      broadcast_->on_applied(document_id_, result.operation, result.version);
    } catch (const std::exception &e) {
      std::fprintf(stderr, "[ot-lite] broadcast of '%s' version %llu failed: %s\n", document_id_.c_str(),
                   static_cast<unsigned long long>(result.version), e.what());
    }
  }

  if (snapshots_ && snapshot_interval_ > 0 && result.version % snapshot_interval_ == 0) {
    try {
      snapshots_->on_snapshot(snapshot_locked());
    } catch (const std::exception &e) {
      std::fprintf(stderr, "[ot-lite] snapshot of '%s' version %llu failed: %s\n", document_id_.c_str(),
                   static_cast<unsigned long long>(result.version), e.what());
    }
  }
}

DocumentSnapshot DocumentCoordinator::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_locked();
}

DocumentSnapshot DocumentCoordinator::snapshot_locked() const {
  return DocumentSnapshot{document_id_, state_.content_utf8(), state_.version()};
}

void DocumentCoordinator::reset(const std::string &content, uint64_t version) {
  std::u32string decoded = utf8::decode(content);

  std::lock_guard<std::mutex> lock(mutex_);
  state_.reset(std::move(decoded), version);
}

DocumentStats DocumentCoordinator::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return DocumentStats{state_.version(), state_.oldest_base_version(), state_.history().size(), state_.length(),
                       state_.poisoned()};
}

DocumentSnapshot DocumentCoordinator::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  return snapshot_locked();
}

// DocumentRegistry implementation

DocumentRegistry::DocumentRegistry(CoordinatorConfig config, BroadcastSink *broadcast, SnapshotSink *snapshots)
    : config_(std::move(config)), broadcast_(broadcast), snapshots_(snapshots) {
  config_.validate();
}

SubmitResult DocumentRegistry::submit(const std::string &document_id, const TextOperation &operation,
                                      uint64_t base_version) {
  return find_or_create(document_id)->submit(operation, base_version);
}

SubmitResult DocumentRegistry::submit(const std::string &document_id, const OperationPayload &payload,
                                      uint64_t base_version) {
  return submit(document_id, TextOperation::from_payload(payload), base_version);
}

void DocumentRegistry::open_document(const std::string &document_id, const std::string &content, uint64_t version) {
  std::u32string decoded = utf8::decode(content);

  std::lock_guard<std::mutex> lock(mutex_);
  if (documents_.count(document_id)) {
    throw InvalidOperation("Document already open: " + document_id);
  }
  documents_.emplace(document_id, std::make_shared<DocumentCoordinator>(document_id, config_, std::move(decoded),
                                                                        version, broadcast_, snapshots_));
}

DocumentSnapshot DocumentRegistry::get_snapshot(const std::string &document_id) const {
  return find(document_id)->snapshot();
}

DocumentSnapshot DocumentRegistry::close_document(const std::string &document_id) {
  std::shared_ptr<DocumentCoordinator> coordinator;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(document_id);
    if (it == documents_.end()) {
      throw UnknownDocument(document_id);
    }
    coordinator = std::move(it->second);
    documents_.erase(it);
  }
  // Waits for an in-flight submit, whose edit is then part of the snapshot
  return coordinator->close();
}

void DocumentRegistry::reset_document(const DocumentSnapshot &snapshot) {
  find(snapshot.document_id)->reset(snapshot.content, snapshot.version);
}

DocumentStats DocumentRegistry::stats(const std::string &document_id) const { return find(document_id)->stats(); }

bool DocumentRegistry::contains(const std::string &document_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.count(document_id) > 0;
}

size_t DocumentRegistry::document_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.size();
}

std::vector<std::string> DocumentRegistry::document_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(documents_.size());
  for (const auto &[id, _] : documents_) {
    ids.push_back(id);
  }
  return ids;
}

std::shared_ptr<DocumentCoordinator> DocumentRegistry::find(const std::string &document_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(document_id);
  if (it == documents_.end()) {
    throw UnknownDocument(document_id);
  }
  return it->second;
}

std::shared_ptr<DocumentCoordinator> DocumentRegistry::find_or_create(const std::string &document_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(document_id);
  if (it != documents_.end()) {
    return it->second;
  }
  if (!config_.implicit_create) {
    throw UnknownDocument(document_id);
  }
  auto coordinator =
      std::make_shared<DocumentCoordinator>(document_id, config_, std::u32string(), 0, broadcast_, snapshots_);
  documents_.emplace(document_id, coordinator);
  return coordinator;
}
