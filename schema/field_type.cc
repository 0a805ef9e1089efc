#include "schema/field_type.h"

#include <string_view>

#include "absl/log/log.h"

namespace protoscribe {

std::string_view FieldTypeName(FieldType const type) {
  switch (type) {
    case FieldType::kDouble:
      return "double";
    case FieldType::kFloat:
      return "float";
    case FieldType::kInt32:
      return "int32";
    case FieldType::kInt64:
      return "int64";
    case FieldType::kUInt32:
      return "uint32";
    case FieldType::kUInt64:
      return "uint64";
    case FieldType::kSInt32:
      return "sint32";
    case FieldType::kSInt64:
      return "sint64";
    case FieldType::kFixed32:
      return "fixed32";
    case FieldType::kFixed64:
      return "fixed64";
    case FieldType::kSFixed32:
      return "sfixed32";
    case FieldType::kSFixed64:
      return "sfixed64";
    case FieldType::kBool:
      return "bool";
    case FieldType::kString:
      return "string";
    case FieldType::kBytes:
      return "bytes";
    case FieldType::kMessage:
      return "message";
    case FieldType::kEnum:
      return "enum";
  }
  LOG(FATAL) << "invalid field type: " << static_cast<int>(type);
}

bool IsCustomType(FieldType const type) {
  return type == FieldType::kMessage || type == FieldType::kEnum;
}

bool IsValidMapKeyType(FieldType const type) {
  switch (type) {
    case FieldType::kInt32:
    case FieldType::kInt64:
    case FieldType::kUInt32:
    case FieldType::kUInt64:
    case FieldType::kSInt32:
    case FieldType::kSInt64:
    case FieldType::kFixed32:
    case FieldType::kFixed64:
    case FieldType::kSFixed32:
    case FieldType::kSFixed64:
    case FieldType::kBool:
    case FieldType::kString:
      return true;
    default:
      return false;
  }
}

}  // namespace protoscribe
