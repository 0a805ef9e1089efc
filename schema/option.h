#ifndef __PROTOSCRIBE_SCHEMA_OPTION_H__
#define __PROTOSCRIBE_SCHEMA_OPTION_H__

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/types/span.h"
#include "schema/field_type.h"
#include "schema/field_value.h"
#include "writer/proto_writer.h"

namespace protoscribe {

// The construct an option can be attached to. Each category corresponds to one of the option
// messages of `google/protobuf/descriptor.proto`.
enum class OptionType : int8_t {
  kFile = 0,
  kMessage = 1,
  kField = 2,
  kEnum = 3,
  kEnumValue = 4,
  kService = 5,
  kOneof = 6,
  kMethod = 7,
};

// Returns the fully qualified name of the descriptor message of the option category, e.g.
// "google.protobuf.MessageOptions". That's the message extended by custom options.
std::string_view OptionTypeMessageName(OptionType type);

// True iff `name` is one of the standard options defined by `descriptor.proto` for `type`.
bool IsWellKnownOptionName(OptionType type, std::string_view name);

// An option statement (`option java_package = "foo";`) or, for fields and enum values, an inline
// option (`deprecated = true`).
//
// Custom option names are rendered in parentheses unless they already start with one.
// Message-typed values are rendered as a multi-line block in statements and as a single-line
// `{ key: value ... }` block inline.
class OptionSpec {
 public:
  using Value = std::variant<ScalarValue, std::vector<FieldValue>>;

  class Builder {
   public:
    explicit Builder(OptionType const type, std::string_view const name)
        : type_(type), name_(name) {}

    // Check-fails for field and enum value options, which are rendered inline.
    Builder& SetOptionComment(std::vector<std::string> lines);

    // Integral setters accept the 32- or 64-bit integer types respectively.
    Builder& SetValue(FieldType type, int32_t value);
    Builder& SetValue(FieldType type, int64_t value);
    Builder& SetValue(FieldType type, uint32_t value);
    Builder& SetValue(FieldType type, uint64_t value);
    Builder& SetValue(FieldType type, float value);
    Builder& SetValue(FieldType type, double value);
    Builder& SetValue(FieldType type, bool value);

    // String, bytes or enum literal.
    Builder& SetValue(FieldType type, std::string_view value);
    Builder& SetValue(FieldType const type, char const* const value) {
      return SetValue(type, std::string_view(value));
    }

    // Message-typed value. `type` must be `FieldType::kMessage`.
    Builder& SetValue(FieldType type, std::vector<FieldValue> values);

    // Check-fails if no value was set.
    OptionSpec Build() const;

   private:
    template <typename Scalar>
    Builder& SetScalarValue(FieldType const type, Scalar const value) {
      value_ = internal::MakeScalarValue(type, value);
      value_type_ = type;
      return *this;
    }

    OptionType type_;
    std::string name_;
    std::vector<std::string> comment_;
    std::optional<FieldType> value_type_;
    Value value_;
  };

  static Builder FileOption(std::string_view const name) {
    return Builder(OptionType::kFile, name);
  }

  static Builder MessageOption(std::string_view const name) {
    return Builder(OptionType::kMessage, name);
  }

  static Builder FieldOption(std::string_view const name) {
    return Builder(OptionType::kField, name);
  }

  static Builder EnumOption(std::string_view const name) {
    return Builder(OptionType::kEnum, name);
  }

  static Builder EnumValueOption(std::string_view const name) {
    return Builder(OptionType::kEnumValue, name);
  }

  static Builder ServiceOption(std::string_view const name) {
    return Builder(OptionType::kService, name);
  }

  static Builder OneofOption(std::string_view const name) {
    return Builder(OptionType::kOneof, name);
  }

  static Builder MethodOption(std::string_view const name) {
    return Builder(OptionType::kMethod, name);
  }

  OptionSpec(OptionSpec const&) = default;
  OptionSpec& operator=(OptionSpec const&) = default;
  OptionSpec(OptionSpec&&) noexcept = default;
  OptionSpec& operator=(OptionSpec&&) noexcept = default;

  OptionType type() const { return type_; }
  std::string_view name() const { return name_; }

  // True for field and enum value options.
  bool is_inline() const { return type_ == OptionType::kField || type_ == OptionType::kEnumValue; }

  // The option name as it appears in the source, with parentheses for custom options.
  std::string FormattedName() const;

  void Emit(writer::ProtoWriter* writer) const;

 private:
  explicit OptionSpec(OptionType const type, std::string name, std::vector<std::string> comment,
                      FieldType const value_type, Value value)
      : type_(type),
        name_(std::move(name)),
        comment_(std::move(comment)),
        value_type_(value_type),
        value_(std::move(value)) {}

  OptionType type_;
  std::string name_;
  std::vector<std::string> comment_;
  FieldType value_type_;
  Value value_;
};

// Emits a bracketed inline option list (` [a = 1, b = 2]`), or nothing if `options` is empty.
// Entries that don't fit in the line are wrapped.
void EmitFieldOptions(absl::Span<OptionSpec const> options, writer::ProtoWriter* writer);

// Emits option statements, one per line.
void EmitOptions(absl::Span<OptionSpec const> options, writer::ProtoWriter* writer);

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_OPTION_H__
