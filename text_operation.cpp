// text_operation.cpp
#include "text_operation.hpp"
#include "utf8.hpp"

#include <uuid/uuid.h> // libuuid

#include <sstream>
#include <utility>

const char *to_string(OperationKind kind) {
  switch (kind) {
  case OperationKind::Insert:
    return "insert";
  case OperationKind::Delete:
    return "delete";
  case OperationKind::Retain:
    return "retain";
  case OperationKind::Replace:
    return "replace";
  }
  return "unknown";
}

std::optional<OperationKind> parse_operation_kind(std::string_view name) {
  if (name == "insert")
    return OperationKind::Insert;
  if (name == "delete")
    return OperationKind::Delete;
  if (name == "retain")
    return OperationKind::Retain;
  if (name == "replace")
    return OperationKind::Replace;
  return std::nullopt;
}

std::string generate_operation_id() {
  uuid_t uuid;
  uuid_generate(uuid);

  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);

  return std::string(uuid_str);
}

namespace {

std::string id_or_generate(std::string operation_id) {
  if (operation_id.empty()) {
    return generate_operation_id();
  }
  return operation_id;
}

std::u32string decode_payload_text(std::string_view text, const char *kind) {
  std::u32string decoded = utf8::decode(text);
  if (decoded.empty()) {
    throw InvalidOperation(std::string(kind) + " requires non-empty content");
  }
  return decoded;
}

} // namespace

TextOperation::TextOperation(OperationKind kind, uint64_t position, uint64_t length, std::u32string content,
                             std::string author_id, uint64_t logical_time, std::string operation_id)
    : kind_(kind), position_(position), length_(length), content_(std::move(content)), author_id_(std::move(author_id)),
      logical_time_(logical_time), operation_id_(std::move(operation_id)) {}

TextOperation TextOperation::make_insert(uint64_t position, std::string_view text, std::string author_id,
                                         uint64_t logical_time, std::string operation_id) {
  return TextOperation(OperationKind::Insert, position, 0, decode_payload_text(text, "Insert"), std::move(author_id),
                       logical_time, id_or_generate(std::move(operation_id)));
}

TextOperation TextOperation::make_delete(uint64_t position, uint64_t length, std::string author_id,
                                         uint64_t logical_time, std::string operation_id) {
  if (length == 0) {
    throw InvalidOperation("Delete requires a non-zero length");
  }
  return TextOperation(OperationKind::Delete, position, length, {}, std::move(author_id), logical_time,
                       id_or_generate(std::move(operation_id)));
}

TextOperation TextOperation::make_retain(uint64_t position, std::string author_id, uint64_t logical_time,
                                         std::string operation_id) {
  return TextOperation(OperationKind::Retain, position, 0, {}, std::move(author_id), logical_time,
                       id_or_generate(std::move(operation_id)));
}

TextOperation TextOperation::make_replace(uint64_t position, uint64_t length, std::string_view text,
                                          std::string author_id, uint64_t logical_time, std::string operation_id) {
  if (length == 0) {
    throw InvalidOperation("Replace requires a non-zero length");
  }
  return TextOperation(OperationKind::Replace, position, length, decode_payload_text(text, "Replace"),
                       std::move(author_id), logical_time, id_or_generate(std::move(operation_id)));
}

TextOperation TextOperation::from_payload(const OperationPayload &payload) {
  auto kind = parse_operation_kind(payload.kind);
  if (!kind) {
    throw InvalidOperation("Unknown operation kind: '" + payload.kind + "'");
  }
  if (payload.position < 0) {
    throw InvalidOperation("Negative position: " + std::to_string(payload.position));
  }
  if (payload.logical_time < 0) {
    throw InvalidOperation("Negative logical time: " + std::to_string(payload.logical_time));
  }
  if (payload.length && *payload.length < 0) {
    throw InvalidOperation("Negative length: " + std::to_string(*payload.length));
  }
  if (payload.author_id.empty()) {
    throw InvalidOperation("Missing author id");
  }
  if (payload.operation_id.empty()) {
    throw InvalidOperation("Missing operation id");
  }

  uint64_t position = static_cast<uint64_t>(payload.position);
  uint64_t logical_time = static_cast<uint64_t>(payload.logical_time);
  bool has_text = payload.content && !payload.content->empty();
  bool has_length = payload.length && *payload.length > 0;

  switch (*kind) {
  case OperationKind::Insert:
    if (!payload.content) {
      throw InvalidOperation("Insert requires content");
    }
    if (has_length) {
      throw InvalidOperation("Insert must not carry a length");
    }
    return make_insert(position, *payload.content, payload.author_id, logical_time, payload.operation_id);

  case OperationKind::Delete:
    if (!payload.length) {
      throw InvalidOperation("Delete requires a length");
    }
    if (has_text) {
      throw InvalidOperation("Delete must not carry content");
    }
    return make_delete(position, static_cast<uint64_t>(*payload.length), payload.author_id, logical_time,
                       payload.operation_id);

  case OperationKind::Retain:
    if (has_text || has_length) {
      throw InvalidOperation("Retain must not carry content or length");
    }
    return make_retain(position, payload.author_id, logical_time, payload.operation_id);

  case OperationKind::Replace:
    if (!payload.content || !payload.length) {
      throw InvalidOperation("Replace requires content and length");
    }
    return make_replace(position, static_cast<uint64_t>(*payload.length), *payload.content, payload.author_id,
                        logical_time, payload.operation_id);
  }
  throw InvalidOperation("Unhandled operation kind");
}

std::string TextOperation::content_utf8() const { return utf8::encode(content_); }

void TextOperation::validate_against(uint64_t document_length) const {
  if (position_ > document_length || length_ > document_length - position_) {
    throw InvalidOperation(std::string(::to_string(kind_)) + " at " + std::to_string(position_) + " spanning " +
                           std::to_string(length_) + " exceeds document length " + std::to_string(document_length));
  }
}

void TextOperation::apply_to(std::u32string &content) const {
  validate_against(content.size());

  switch (kind_) {
  case OperationKind::Insert:
    content.insert(position_, content_);
    break;
  case OperationKind::Delete:
    content.erase(position_, length_);
    break;
  case OperationKind::Retain:
    break;
  case OperationKind::Replace:
    content.replace(position_, length_, content_);
    break;
  }
}

TextOperation TextOperation::rebased_as(OperationKind kind, uint64_t position, uint64_t length) const {
  bool keeps_content = kind == OperationKind::Insert || kind == OperationKind::Replace;
  return TextOperation(kind, position, length, keeps_content ? content_ : std::u32string(), author_id_, logical_time_,
                       operation_id_);
}

OperationPayload TextOperation::to_payload() const {
  OperationPayload payload;
  payload.kind = ::to_string(kind_);
  payload.position = static_cast<int64_t>(position_);
  payload.author_id = author_id_;
  payload.logical_time = static_cast<int64_t>(logical_time_);
  payload.operation_id = operation_id_;

  switch (kind_) {
  case OperationKind::Insert:
    payload.content = content_utf8();
    break;
  case OperationKind::Delete:
    payload.length = static_cast<int64_t>(length_);
    break;
  case OperationKind::Retain:
    break;
  case OperationKind::Replace:
    payload.content = content_utf8();
    payload.length = static_cast<int64_t>(length_);
    break;
  }
  return payload;
}

std::string TextOperation::to_string() const {
  std::ostringstream oss;
  oss << ::to_string(kind_) << "@" << position_;
  if (length_ > 0) {
    oss << "+" << length_;
  }
  if (!content_.empty()) {
    oss << " \"" << content_utf8() << "\"";
  }
  oss << " (" << author_id_ << ", t=" << logical_time_ << ", id=" << operation_id_ << ")";
  return oss.str();
}
