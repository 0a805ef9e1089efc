#ifndef __PROTOSCRIBE_SCHEMA_MESSAGE_FIELD_H__
#define __PROTOSCRIBE_SCHEMA_MESSAGE_FIELD_H__

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/check.h"
#include "schema/buildable.h"
#include "schema/field_type.h"
#include "schema/option.h"
#include "usage/used_field_monitor.h"
#include "writer/proto_writer.h"

namespace protoscribe {

// Highest field number allowed by the protobuf wire format.
inline int32_t constexpr kMaxFieldNumber = 536870911;

// A plain message field, e.g. `repeated string foo = 1 [deprecated = true];`.
class MessageFieldSpec {
 public:
  class Builder {
   public:
    // Check-fails unless `number` is in the range [1, kMaxFieldNumber].
    explicit Builder(FieldType type, std::string_view name, int32_t number);

    Builder& SetFieldComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    // Check-fails if the field is optional.
    Builder& SetRepeated(bool repeated);

    // Check-fails if the field is repeated.
    Builder& SetOptional(bool optional);

    // Check-fails unless the field type is message or enum.
    Builder& SetCustomTypeName(std::string_view type_name);

    // Check-fails on options that aren't field options.
    template <typename... Options>
    Builder& AddFieldOptions(Options&&... options) {
      internal::AppendBuiltChecked(&options_, &CheckOption, std::forward<Options>(options)...);
      return *this;
    }

    // Check-fails if the type is message or enum and no custom type name was set.
    MessageFieldSpec Build() const;

   private:
    friend class MessageFieldSpec;

    static void CheckOption(OptionSpec const& option) {
      CHECK(option.type() == OptionType::kField) << "option must be field type";
    }

    FieldType type_;
    std::string name_;
    int32_t number_;
    std::vector<std::string> comment_;
    bool repeated_ = false;
    bool optional_ = false;
    std::optional<std::string> custom_type_name_;
    std::vector<OptionSpec> options_;
  };

  static Builder Repeated(FieldType const type, std::string_view const name,
                          int32_t const number) {
    Builder builder{type, name, number};
    builder.SetRepeated(true);
    return builder;
  }

  static Builder Optional(FieldType const type, std::string_view const name,
                          int32_t const number) {
    Builder builder{type, name, number};
    builder.SetOptional(true);
    return builder;
  }

  // A field whose type is the message called `type_name`.
  static Builder Message(std::string_view const type_name, std::string_view const name,
                         int32_t const number) {
    Builder builder{FieldType::kMessage, name, number};
    builder.SetCustomTypeName(type_name);
    return builder;
  }

  // A field whose type is the enum called `type_name`.
  static Builder Enum(std::string_view const type_name, std::string_view const name,
                      int32_t const number) {
    Builder builder{FieldType::kEnum, name, number};
    builder.SetCustomTypeName(type_name);
    return builder;
  }

  MessageFieldSpec(MessageFieldSpec const&) = default;
  MessageFieldSpec& operator=(MessageFieldSpec const&) = default;
  MessageFieldSpec(MessageFieldSpec&&) noexcept = default;
  MessageFieldSpec& operator=(MessageFieldSpec&&) noexcept = default;

  FieldType type() const { return type_; }
  std::string_view name() const { return name_; }
  int32_t number() const { return number_; }
  bool is_repeated() const { return repeated_; }
  bool is_optional() const { return optional_; }

  usage::FieldIdentity field_identity() const {
    return usage::FieldIdentity{.name = name_, .number = number_};
  }

  void Emit(writer::ProtoWriter* writer) const;

 private:
  explicit MessageFieldSpec(Builder const& builder);

  FieldType type_;
  std::string name_;
  int32_t number_;
  std::vector<std::string> comment_;
  bool repeated_;
  bool optional_;
  std::string type_name_;
  std::vector<OptionSpec> options_;
};

// A map field, e.g. `map<string, Foo> foos = 2;`.
class MapFieldSpec {
 public:
  class Builder {
   public:
    // Check-fails if `key_type` is not an integral, bool or string type, or if `number` is out of
    // range.
    explicit Builder(FieldType key_type, FieldType value_type, std::string_view name,
                     int32_t number);

    Builder& SetFieldComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    // Check-fails unless the value type is message or enum.
    Builder& SetCustomTypeName(std::string_view type_name);

    // Check-fails on options that aren't field options.
    template <typename... Options>
    Builder& AddFieldOptions(Options&&... options) {
      internal::AppendBuiltChecked(&options_, &CheckOption, std::forward<Options>(options)...);
      return *this;
    }

    // Check-fails if the value type is message or enum and no custom type name was set.
    MapFieldSpec Build() const;

   private:
    friend class MapFieldSpec;

    static void CheckOption(OptionSpec const& option) {
      CHECK(option.type() == OptionType::kField) << "option must be field type";
    }

    FieldType key_type_;
    FieldType value_type_;
    std::string name_;
    int32_t number_;
    std::vector<std::string> comment_;
    std::optional<std::string> custom_type_name_;
    std::vector<OptionSpec> options_;
  };

  MapFieldSpec(MapFieldSpec const&) = default;
  MapFieldSpec& operator=(MapFieldSpec const&) = default;
  MapFieldSpec(MapFieldSpec&&) noexcept = default;
  MapFieldSpec& operator=(MapFieldSpec&&) noexcept = default;

  std::string_view name() const { return name_; }
  int32_t number() const { return number_; }

  usage::FieldIdentity field_identity() const {
    return usage::FieldIdentity{.name = name_, .number = number_};
  }

  void Emit(writer::ProtoWriter* writer) const;

 private:
  explicit MapFieldSpec(Builder const& builder);

  FieldType key_type_;
  FieldType value_type_;
  std::string name_;
  int32_t number_;
  std::vector<std::string> comment_;
  std::string value_type_name_;
  std::vector<OptionSpec> options_;
};

class OneofFieldSpec;

// Any of the field kinds that can appear in a message body.
using MessageField = std::variant<MessageFieldSpec, MapFieldSpec, OneofFieldSpec>;

// A oneof group. Its members are plain, non-repeated fields and share the field namespace of the
// enclosing message, together with the name of the group itself.
class OneofFieldSpec {
 public:
  class Builder {
   public:
    explicit Builder(std::string_view const name) : name_(name) {}

    Builder& SetFieldComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    // Accepts plain fields (or builders thereof). Check-fails on map fields, oneofs, repeated
    // fields and explicitly optional fields.
    template <typename... Fields>
    Builder& AddMessageFields(Fields&&... fields) {
      (AddMember(internal::BuildIfNeeded(std::forward<Fields>(fields))), ...);
      return *this;
    }

    // Check-fails on options that aren't oneof options.
    template <typename... Options>
    Builder& AddOneofOptions(Options&&... options) {
      internal::AppendBuiltChecked(&options_, &CheckOption, std::forward<Options>(options)...);
      return *this;
    }

    OneofFieldSpec Build() const { return OneofFieldSpec(name_, comment_, fields_, options_); }

   private:
    static void CheckOption(OptionSpec const& option) {
      CHECK(option.type() == OptionType::kOneof) << "option must be oneof type";
    }

    void AddMember(MessageFieldSpec const& field);
    void AddMember(MapFieldSpec const& field);
    void AddMember(OneofFieldSpec const& field);
    void AddMember(MessageField const& field);

    std::string name_;
    std::vector<std::string> comment_;
    std::vector<MessageFieldSpec> fields_;
    std::vector<OptionSpec> options_;
  };

  OneofFieldSpec(OneofFieldSpec const&) = default;
  OneofFieldSpec& operator=(OneofFieldSpec const&) = default;
  OneofFieldSpec(OneofFieldSpec&&) noexcept = default;
  OneofFieldSpec& operator=(OneofFieldSpec&&) noexcept = default;

  std::string_view name() const { return name_; }
  std::vector<MessageFieldSpec> const& fields() const { return fields_; }

  std::string_view group_name() const { return name_; }
  std::vector<usage::FieldIdentity> member_identities() const;

  void Emit(writer::ProtoWriter* writer) const;

 private:
  explicit OneofFieldSpec(std::string name, std::vector<std::string> comment,
                          std::vector<MessageFieldSpec> fields, std::vector<OptionSpec> options)
      : name_(std::move(name)),
        comment_(std::move(comment)),
        fields_(std::move(fields)),
        options_(std::move(options)) {}

  std::string name_;
  std::vector<std::string> comment_;
  std::vector<MessageFieldSpec> fields_;
  std::vector<OptionSpec> options_;
};

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_MESSAGE_FIELD_H__
