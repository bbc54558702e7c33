// ot_errors.hpp
#ifndef OT_ERRORS_HPP
#define OT_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

/// Classifies every error the engine reports to its caller.
enum class OTErrorKind {
  InvalidOperation,          // Malformed input or out-of-bounds edit (caller bug, do not retry)
  StaleClient,               // Base version older than retained history (resync, then retry)
  UnknownDocument,           // No document state and implicit creation disabled
  InternalInvariantViolation // Engine bug, document refuses further mutation until reset
};

inline const char *to_string(OTErrorKind kind) {
  switch (kind) {
  case OTErrorKind::InvalidOperation:
    return "InvalidOperation";
  case OTErrorKind::StaleClient:
    return "StaleClient";
  case OTErrorKind::UnknownDocument:
    return "UnknownDocument";
  case OTErrorKind::InternalInvariantViolation:
    return "InternalInvariantViolation";
  }
  return "Unknown";
}

/// Base exception for all engine errors
class OTException : public std::runtime_error {
public:
  OTException(OTErrorKind kind, const std::string &msg) : std::runtime_error(msg), kind_(kind) {}

  OTErrorKind kind() const { return kind_; }

private:
  OTErrorKind kind_;
};

class InvalidOperation : public OTException {
public:
  explicit InvalidOperation(const std::string &msg) : OTException(OTErrorKind::InvalidOperation, msg) {}
};

/// Thrown when a client's base version predates the retained history window.
/// The caller must fetch a snapshot and resubmit against `current_version()`.
class StaleClient : public OTException {
public:
  StaleClient(uint64_t base_version, uint64_t oldest_base_version, uint64_t current_version)
      : OTException(OTErrorKind::StaleClient,
                    "Base version " + std::to_string(base_version) + " is older than the retained history (oldest " +
                        std::to_string(oldest_base_version) + ", current " + std::to_string(current_version) + ")"),
        base_version_(base_version), oldest_base_version_(oldest_base_version), current_version_(current_version) {}

  uint64_t base_version() const { return base_version_; }
  uint64_t oldest_base_version() const { return oldest_base_version_; }
  uint64_t current_version() const { return current_version_; }

private:
  uint64_t base_version_;
  uint64_t oldest_base_version_;
  uint64_t current_version_;
};

class UnknownDocument : public OTException {
public:
  explicit UnknownDocument(const std::string &document_id)
      : OTException(OTErrorKind::UnknownDocument, "Unknown document: " + document_id), document_id_(document_id) {}

  const std::string &document_id() const { return document_id_; }

private:
  std::string document_id_;
};

class InternalInvariantViolation : public OTException {
public:
  explicit InternalInvariantViolation(const std::string &msg)
      : OTException(OTErrorKind::InternalInvariantViolation, msg) {}
};

#endif // OT_ERRORS_HPP
