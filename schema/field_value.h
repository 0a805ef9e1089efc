#ifndef __PROTOSCRIBE_SCHEMA_FIELD_VALUE_H__
#define __PROTOSCRIBE_SCHEMA_FIELD_VALUE_H__

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "schema/field_type.h"

namespace protoscribe {

// A scalar option value. Which alternative is held depends on the `FieldType` the value was set
// with: 32- and 64-bit integers, float, double, bool, or text for string, bytes and enum literals.
using ScalarValue =
    std::variant<int32_t, int64_t, uint32_t, uint64_t, float, double, bool, std::string>;

namespace internal {

// The following functions check-fail if `type` can't hold a value of the given C++ type.

ScalarValue MakeScalarValue(FieldType type, int32_t value);
ScalarValue MakeScalarValue(FieldType type, int64_t value);
ScalarValue MakeScalarValue(FieldType type, uint32_t value);
ScalarValue MakeScalarValue(FieldType type, uint64_t value);
ScalarValue MakeScalarValue(FieldType type, float value);
ScalarValue MakeScalarValue(FieldType type, double value);
ScalarValue MakeScalarValue(FieldType type, bool value);
ScalarValue MakeScalarValue(FieldType type, std::string_view value);

}  // namespace internal

// Renders a scalar the way it appears in `.proto` source. Strings and bytes are quoted and
// C-escaped, enum literals are rendered bare.
std::string FormatScalarValue(FieldType type, ScalarValue const& value);

// A named scalar, i.e. one entry of a message-typed option value.
class FieldValue {
 public:
  explicit FieldValue(std::string_view const name, FieldType const type, int32_t const value)
      : name_(name), type_(type), value_(internal::MakeScalarValue(type, value)) {}

  explicit FieldValue(std::string_view const name, FieldType const type, int64_t const value)
      : name_(name), type_(type), value_(internal::MakeScalarValue(type, value)) {}

  explicit FieldValue(std::string_view const name, FieldType const type, uint32_t const value)
      : name_(name), type_(type), value_(internal::MakeScalarValue(type, value)) {}

  explicit FieldValue(std::string_view const name, FieldType const type, uint64_t const value)
      : name_(name), type_(type), value_(internal::MakeScalarValue(type, value)) {}

  explicit FieldValue(std::string_view const name, FieldType const type, float const value)
      : name_(name), type_(type), value_(internal::MakeScalarValue(type, value)) {}

  explicit FieldValue(std::string_view const name, FieldType const type, double const value)
      : name_(name), type_(type), value_(internal::MakeScalarValue(type, value)) {}

  explicit FieldValue(std::string_view const name, FieldType const type, bool const value)
      : name_(name), type_(type), value_(internal::MakeScalarValue(type, value)) {}

  explicit FieldValue(std::string_view const name, FieldType const type,
                      std::string_view const value)
      : name_(name), type_(type), value_(internal::MakeScalarValue(type, value)) {}

  // Prevents string literals from decaying to `bool`.
  explicit FieldValue(std::string_view const name, FieldType const type, char const* const value)
      : FieldValue(name, type, std::string_view(value)) {}

  FieldValue(FieldValue const&) = default;
  FieldValue& operator=(FieldValue const&) = default;
  FieldValue(FieldValue&&) noexcept = default;
  FieldValue& operator=(FieldValue&&) noexcept = default;

  std::string_view name() const { return name_; }
  FieldType type() const { return type_; }
  ScalarValue const& value() const { return value_; }

  std::string FormattedValue() const { return FormatScalarValue(type_, value_); }

 private:
  std::string name_;
  FieldType type_;
  ScalarValue value_;
};

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_FIELD_VALUE_H__
