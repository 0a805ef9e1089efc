#include "schema/message_field.h"

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "schema/field_type.h"
#include "schema/option.h"
#include "usage/used_field_monitor.h"
#include "writer/proto_writer.h"

namespace protoscribe {

namespace {

using ::protoscribe::writer::ProtoWriter;

void CheckFieldNumber(int32_t const number) {
  CHECK_GT(number, 0) << "field number must be positive";
  CHECK_LE(number, kMaxFieldNumber) << "field number must be at most " << kMaxFieldNumber;
}

}  // namespace

MessageFieldSpec::Builder::Builder(FieldType const type, std::string_view const name,
                                   int32_t const number)
    : type_(type), name_(name), number_(number) {
  CheckFieldNumber(number);
}

MessageFieldSpec::Builder& MessageFieldSpec::Builder::SetRepeated(bool const repeated) {
  CHECK(!optional_) << "optional fields cannot be repeated";
  repeated_ = repeated;
  return *this;
}

MessageFieldSpec::Builder& MessageFieldSpec::Builder::SetOptional(bool const optional) {
  CHECK(!repeated_) << "repeated fields cannot be explicitly optional";
  optional_ = optional;
  return *this;
}

MessageFieldSpec::Builder& MessageFieldSpec::Builder::SetCustomTypeName(
    std::string_view const type_name) {
  CHECK(IsCustomType(type_)) << "custom type names only supported for message and enum types";
  custom_type_name_.emplace(type_name);
  return *this;
}

MessageFieldSpec MessageFieldSpec::Builder::Build() const {
  CHECK(!IsCustomType(type_) || custom_type_name_.has_value())
      << "'" << name_ << "' type is " << FieldTypeName(type_)
      << " and needs a custom type name associated with it";
  return MessageFieldSpec(*this);
}

MessageFieldSpec::MessageFieldSpec(Builder const& builder)
    : type_(builder.type_),
      name_(builder.name_),
      number_(builder.number_),
      comment_(builder.comment_),
      repeated_(builder.repeated_),
      optional_(builder.optional_),
      type_name_(builder.custom_type_name_.value_or(std::string(FieldTypeName(builder.type_)))),
      options_(builder.options_) {}

void MessageFieldSpec::Emit(ProtoWriter* const writer) const {
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  if (repeated_) {
    writer->Emit("repeated ");
  } else if (optional_) {
    writer->Emit("optional ");
  }
  writer->Emit(type_name_, " ", name_, " = ", number_);
  EmitFieldOptions(options_, writer);
  writer->Emit(";\n");
}

MapFieldSpec::Builder::Builder(FieldType const key_type, FieldType const value_type,
                               std::string_view const name, int32_t const number)
    : key_type_(key_type), value_type_(value_type), name_(name), number_(number) {
  CHECK(IsValidMapKeyType(key_type))
      << "key type must be of an acceptable type (integral, bool or string), got "
      << FieldTypeName(key_type);
  CheckFieldNumber(number);
}

MapFieldSpec::Builder& MapFieldSpec::Builder::SetCustomTypeName(std::string_view const type_name) {
  CHECK(IsCustomType(value_type_))
      << "custom type names only supported for message and enum value types";
  custom_type_name_.emplace(type_name);
  return *this;
}

MapFieldSpec MapFieldSpec::Builder::Build() const {
  CHECK(!IsCustomType(value_type_) || custom_type_name_.has_value())
      << "'" << name_ << "' type is " << FieldTypeName(value_type_)
      << " and requires a custom type name associated with it";
  return MapFieldSpec(*this);
}

MapFieldSpec::MapFieldSpec(Builder const& builder)
    : key_type_(builder.key_type_),
      value_type_(builder.value_type_),
      name_(builder.name_),
      number_(builder.number_),
      comment_(builder.comment_),
      value_type_name_(
          builder.custom_type_name_.value_or(std::string(FieldTypeName(builder.value_type_)))),
      options_(builder.options_) {}

void MapFieldSpec::Emit(ProtoWriter* const writer) const {
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  writer->Emit("map<", FieldTypeName(key_type_), ", ", value_type_name_, "> ", name_, " = ",
               number_);
  EmitFieldOptions(options_, writer);
  writer->Emit(";\n");
}

void OneofFieldSpec::Builder::AddMember(MessageFieldSpec const& field) {
  CHECK(!field.is_repeated()) << "repeated field '" << field.name() << "' not allowed in oneof";
  CHECK(!field.is_optional()) << "optional field '" << field.name() << "' not allowed in oneof";
  fields_.push_back(field);
}

void OneofFieldSpec::Builder::AddMember(MapFieldSpec const& field) {
  LOG(FATAL) << "map field '" << field.name() << "' not allowed in oneof";
}

void OneofFieldSpec::Builder::AddMember(OneofFieldSpec const& field) {
  LOG(FATAL) << "immediate inner oneof field '" << field.name() << "' disallowed";
}

void OneofFieldSpec::Builder::AddMember(MessageField const& field) {
  std::visit([this](auto const& member) { AddMember(member); }, field);
}

std::vector<usage::FieldIdentity> OneofFieldSpec::member_identities() const {
  std::vector<usage::FieldIdentity> identities;
  identities.reserve(fields_.size());
  for (auto const& field : fields_) {
    identities.push_back(field.field_identity());
  }
  return identities;
}

void OneofFieldSpec::Emit(ProtoWriter* const writer) const {
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  writer->Emit("oneof ", name_, " {");
  if (!options_.empty()) {
    writer->Emit("\n");
    ProtoWriter::IndentedScope is{writer};
    EmitOptions(options_, writer);
  }
  if (!fields_.empty()) {
    writer->Emit("\n");
    ProtoWriter::IndentedScope is{writer};
    for (auto const& field : fields_) {
      field.Emit(writer);
    }
  }
  writer->Emit("}\n");
}

}  // namespace protoscribe
