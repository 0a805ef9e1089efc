#include "schema/field_value.h"

#include <array>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include "absl/functional/overload.h"
#include "absl/log/check.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "schema/field_type.h"

namespace protoscribe {

namespace internal {

namespace {

bool Is32BitIntegral(FieldType const type) {
  switch (type) {
    case FieldType::kInt32:
    case FieldType::kUInt32:
    case FieldType::kSInt32:
    case FieldType::kFixed32:
    case FieldType::kSFixed32:
      return true;
    default:
      return false;
  }
}

bool Is64BitIntegral(FieldType const type) {
  switch (type) {
    case FieldType::kInt64:
    case FieldType::kUInt64:
    case FieldType::kSInt64:
    case FieldType::kFixed64:
    case FieldType::kSFixed64:
      return true;
    default:
      return false;
  }
}

// Shortest text that parses back to the same value.
template <typename Float>
std::string FormatFloatingPoint(Float const value) {
  std::array<char, 64> buffer;
  auto const [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  CHECK(ec == std::errc()) << "cannot format floating point value";
  return std::string(buffer.data(), ptr);
}

bool IsUnsigned(FieldType const type) {
  return type == FieldType::kUInt32 || type == FieldType::kUInt64 ||
         type == FieldType::kFixed32 || type == FieldType::kFixed64;
}

}  // namespace

ScalarValue MakeScalarValue(FieldType const type, int32_t const value) {
  CHECK(Is32BitIntegral(type)) << "'" << FieldTypeName(type) << "' invalid type for an int value";
  CHECK(!IsUnsigned(type) || value >= 0)
      << "negative value " << value << " for '" << FieldTypeName(type) << "'";
  return value;
}

ScalarValue MakeScalarValue(FieldType const type, int64_t const value) {
  CHECK(Is64BitIntegral(type)) << "'" << FieldTypeName(type) << "' invalid type for a long value";
  CHECK(!IsUnsigned(type) || value >= 0)
      << "negative value " << value << " for '" << FieldTypeName(type) << "'";
  return value;
}

ScalarValue MakeScalarValue(FieldType const type, uint32_t const value) {
  CHECK(type == FieldType::kUInt32 || type == FieldType::kFixed32)
      << "'" << FieldTypeName(type) << "' invalid type for an unsigned int value";
  return value;
}

ScalarValue MakeScalarValue(FieldType const type, uint64_t const value) {
  CHECK(type == FieldType::kUInt64 || type == FieldType::kFixed64)
      << "'" << FieldTypeName(type) << "' invalid type for an unsigned long value";
  return value;
}

ScalarValue MakeScalarValue(FieldType const type, float const value) {
  CHECK(type == FieldType::kFloat) << "'" << FieldTypeName(type)
                                   << "' invalid type for a float value";
  return value;
}

ScalarValue MakeScalarValue(FieldType const type, double const value) {
  CHECK(type == FieldType::kDouble) << "'" << FieldTypeName(type)
                                    << "' invalid type for a double value";
  return value;
}

ScalarValue MakeScalarValue(FieldType const type, bool const value) {
  CHECK(type == FieldType::kBool) << "'" << FieldTypeName(type)
                                  << "' invalid type for a bool value";
  return value;
}

ScalarValue MakeScalarValue(FieldType const type, std::string_view const value) {
  CHECK(type == FieldType::kString || type == FieldType::kBytes || type == FieldType::kEnum)
      << "'" << FieldTypeName(type) << "' invalid type for a string value";
  return std::string(value);
}

}  // namespace internal

std::string FormatScalarValue(FieldType const type, ScalarValue const& value) {
  return std::visit(absl::Overload{
                        [](bool const value) -> std::string { return value ? "true" : "false"; },
                        [type](std::string const& value) -> std::string {
                          if (type == FieldType::kEnum) {
                            return value;
                          } else {
                            return absl::StrCat("\"", absl::CEscape(value), "\"");
                          }
                        },
                        [](float const value) { return internal::FormatFloatingPoint(value); },
                        [](double const value) { return internal::FormatFloatingPoint(value); },
                        [](auto const value) -> std::string { return absl::StrCat(value); },
                    },
                    value);
}

}  // namespace protoscribe
