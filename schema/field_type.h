#ifndef __PROTOSCRIBE_SCHEMA_FIELD_TYPE_H__
#define __PROTOSCRIBE_SCHEMA_FIELD_TYPE_H__

#include <cstdint>
#include <string_view>

namespace protoscribe {

enum class FieldType : int8_t {
  kDouble = 0,
  kFloat = 1,
  kInt32 = 2,
  kInt64 = 3,
  kUInt32 = 4,
  kUInt64 = 5,
  kSInt32 = 6,
  kSInt64 = 7,
  kFixed32 = 8,
  kFixed64 = 9,
  kSFixed32 = 10,
  kSFixed64 = 11,
  kBool = 12,
  kString = 13,
  kBytes = 14,
  kMessage = 15,
  kEnum = 16,
};

// Returns the `.proto` keyword of the type, e.g. "sfixed64". Message and enum types don't have a
// keyword of their own and are rendered as "message" and "enum" here; fields of those types use a
// custom type name instead.
std::string_view FieldTypeName(FieldType type);

// True for message and enum types, which require a custom type name.
bool IsCustomType(FieldType type);

// True for the integral, bool and string types allowed as map keys.
bool IsValidMapKeyType(FieldType type);

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_FIELD_TYPE_H__
