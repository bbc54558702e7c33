// text_operation.hpp
#ifndef TEXT_OPERATION_HPP
#define TEXT_OPERATION_HPP

#include "ot_errors.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/// The closed set of edit kinds. Every switch over this enum is exhaustive.
enum class OperationKind : uint8_t { Insert = 1, Delete = 2, Retain = 3, Replace = 4 };

const char *to_string(OperationKind kind);

/// Parses the wire spelling ("insert", "delete", "retain", "replace")
std::optional<OperationKind> parse_operation_kind(std::string_view name);

/// Wire form of an operation as exchanged with the session layer.
///
/// Integer fields are signed so that negative values coming off the wire can be
/// rejected instead of wrapping around. `content` and `length` are optional and
/// required only for the kinds that use them.
struct OperationPayload {
  std::string kind;
  int64_t position = 0;
  std::optional<std::string> content; // UTF-8
  std::optional<int64_t> length;
  std::string author_id;
  int64_t logical_time = 0;
  std::string operation_id;

  bool operator==(const OperationPayload &other) const = default;
};

/// Deterministic total order used whenever two concurrent operations compete
/// for the same position or range: logical time first, then author, then
/// operation id so that no two distinct operations ever compare equal.
struct TieBreakKey {
  uint64_t logical_time;
  std::string author_id;
  std::string operation_id;

  auto operator<=>(const TieBreakKey &other) const = default;
  bool operator==(const TieBreakKey &other) const = default;
};

/// Generates a fresh operation id (random UUID, libuuid)
std::string generate_operation_id();

/// Immutable description of a single edit.
///
/// Positions and lengths count Unicode scalar values. Instances are only
/// created through the validating factories below; transforms produce new
/// values through `rebased_as()`.
class TextOperation {
public:
  /// @throws InvalidOperation if `text` is empty or not valid UTF-8
  static TextOperation make_insert(uint64_t position, std::string_view text, std::string author_id,
                                   uint64_t logical_time, std::string operation_id = {});

  /// @throws InvalidOperation if `length` is zero
  static TextOperation make_delete(uint64_t position, uint64_t length, std::string author_id, uint64_t logical_time,
                                   std::string operation_id = {});

  static TextOperation make_retain(uint64_t position, std::string author_id, uint64_t logical_time,
                                   std::string operation_id = {});

  /// @throws InvalidOperation if `length` is zero or `text` is empty or not valid UTF-8
  static TextOperation make_replace(uint64_t position, uint64_t length, std::string_view text, std::string author_id,
                                    uint64_t logical_time, std::string operation_id = {});

  /// Builds an operation from its wire form.
  /// @throws InvalidOperation on unknown kind, negative values, missing or superfluous fields
  static TextOperation from_payload(const OperationPayload &payload);

  OperationKind kind() const { return kind_; }
  uint64_t position() const { return position_; }
  uint64_t length() const { return length_; }
  uint64_t end() const { return position_ + length_; }
  const std::u32string &content() const { return content_; }
  std::string content_utf8() const;
  uint64_t content_length() const { return content_.size(); }
  const std::string &author_id() const { return author_id_; }
  uint64_t logical_time() const { return logical_time_; }
  const std::string &operation_id() const { return operation_id_; }

  TieBreakKey tie_break_key() const { return TieBreakKey{logical_time_, author_id_, operation_id_}; }

  /// Number of units the operation removes from the document
  uint64_t removed_length() const { return length_; }

  /// Number of units the operation adds to the document
  uint64_t inserted_length() const { return content_.size(); }

  bool is_noop() const { return kind_ == OperationKind::Retain; }

  /// Checks the operation against a document of `document_length` units.
  /// @throws InvalidOperation if the operation reaches past the end of the document
  void validate_against(uint64_t document_length) const;

  /// Applies the edit in place.
  /// @throws InvalidOperation if the operation is out of bounds for `content`
  void apply_to(std::u32string &content) const;

  /// Returns a copy with the same identity (author, logical time, id) and
  /// content, but a new kind and span. Content is dropped for Delete/Retain.
  TextOperation rebased_as(OperationKind kind, uint64_t position, uint64_t length) const;

  OperationPayload to_payload() const;

  std::string to_string() const;

  bool operator==(const TextOperation &other) const = default;

private:
  TextOperation(OperationKind kind, uint64_t position, uint64_t length, std::u32string content, std::string author_id,
                uint64_t logical_time, std::string operation_id);

  OperationKind kind_;
  uint64_t position_;
  uint64_t length_;
  std::u32string content_;
  std::string author_id_;
  uint64_t logical_time_;
  std::string operation_id_;
};

#endif // TEXT_OPERATION_HPP
