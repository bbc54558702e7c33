// document_state.hpp
#ifndef OT_DOCUMENT_STATE_HPP
#define OT_DOCUMENT_STATE_HPP

#include "text_operation.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>

/// One applied operation in the history window
struct HistoryEntry {
  TextOperation operation; // As applied (already rebased)
  uint64_t version;        // Version this operation produced
  uint64_t length_before;  // Document length the operation was applied to
};

/// Recorded outcome of an applied operation id
struct AppliedRecord {
  TextOperation operation;
  uint64_t version;
};

/// Versioned content of one document plus the bounded history needed to
/// rebase late clients.
///
/// Not synchronized: exclusively owned and locked by its DocumentCoordinator.
class DocumentState {
public:
  using History = std::deque<HistoryEntry>;

  DocumentState(size_t history_limit, size_t dedup_limit, std::u32string content = {}, uint64_t version = 0);

  uint64_t version() const { return version_; }
  const std::u32string &content() const { return content_; }
  std::string content_utf8() const;
  uint64_t length() const { return content_.size(); }

  const History &history() const { return history_; }

  /// Oldest base version a client may submit against
  uint64_t oldest_base_version() const { return version_ - history_.size(); }

  bool can_rebase_from(uint64_t base_version) const {
    return base_version >= oldest_base_version() && base_version <= version_;
  }

  /// Document length as it was at `base_version`. Requires can_rebase_from(base_version).
  uint64_t length_at(uint64_t base_version) const;

  /// History entries applied after `base_version`, oldest first.
  /// Requires can_rebase_from(base_version).
  History::const_iterator entries_after(uint64_t base_version) const;

  /// Previously recorded outcome for an operation id, if still remembered
  std::optional<AppliedRecord> find_applied(const std::string &operation_id) const;

  /// Applies an operation that is already valid against the current content,
  /// appends it to the history and advances the version.
  /// @throws InvalidOperation if the operation does not fit the current content (state is untouched)
  uint64_t apply(const TextOperation &operation);

  /// Discards history and remembered ids and installs new content
  void reset(std::u32string content, uint64_t version);

  bool poisoned() const { return poisoned_.has_value(); }
  const std::string &poison_reason() const { return *poisoned_; }
  void poison(std::string reason) { poisoned_ = std::move(reason); }

private:
  void remember(const TextOperation &operation, uint64_t version);

  std::u32string content_;
  uint64_t version_;
  History history_;
  size_t history_limit_;

  // Duplicate detection, FIFO bounded by dedup_limit_
  std::unordered_map<std::string, AppliedRecord> applied_;
  std::deque<std::string> applied_order_;
  size_t dedup_limit_;

  std::optional<std::string> poisoned_;
};

#endif // OT_DOCUMENT_STATE_HPP
