// document_state.cpp
#include "document_state.hpp"
#include "utf8.hpp"

DocumentState::DocumentState(size_t history_limit, size_t dedup_limit, std::u32string content, uint64_t version)
    : content_(std::move(content)), version_(version), history_limit_(history_limit), dedup_limit_(dedup_limit) {}

std::string DocumentState::content_utf8() const { return utf8::encode(content_); }

uint64_t DocumentState::length_at(uint64_t base_version) const {
  if (base_version == version_) {
    return content_.size();
  }
  return entries_after(base_version)->length_before;
}

DocumentState::History::const_iterator DocumentState::entries_after(uint64_t base_version) const {
  // history_[i].version == oldest_base_version() + 1 + i
  return history_.begin() + static_cast<History::difference_type>(base_version - oldest_base_version());
}

std::optional<AppliedRecord> DocumentState::find_applied(const std::string &operation_id) const {
  auto it = applied_.find(operation_id);
  if (it == applied_.end()) {
    return std::nullopt;
  }
  return it->second;
}

uint64_t DocumentState::apply(const TextOperation &operation) {
  uint64_t length_before = content_.size();
  operation.apply_to(content_);

  ++version_;
  history_.push_back(HistoryEntry{operation, version_, length_before});
  while (history_.size() > history_limit_) {
    history_.pop_front();
  }
  remember(operation, version_);
  return version_;
}

void DocumentState::remember(const TextOperation &operation, uint64_t version) {
  if (applied_.insert_or_assign(operation.operation_id(), AppliedRecord{operation, version}).second) {
    applied_order_.push_back(operation.operation_id());
  }
  while (applied_order_.size() > dedup_limit_) {
    applied_.erase(applied_order_.front());
    applied_order_.pop_front();
  }
}

void DocumentState::reset(std::u32string content, uint64_t version) {
  content_ = std::move(content);
  version_ = version;
  history_.clear();
  applied_.clear();
  applied_order_.clear();
  poisoned_.reset();
}
