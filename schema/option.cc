#include "schema/option.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/functional/overload.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "schema/field_type.h"
#include "schema/field_value.h"
#include "writer/proto_writer.h"

namespace protoscribe {

namespace {

using ::protoscribe::writer::ProtoWriter;

auto constexpr kWellKnownFileOptions = std::array<std::string_view, 21>{
    "java_package",
    "java_outer_classname",
    "java_multiple_files",
    "java_generate_equals_and_hash",
    "java_string_check_utf8",
    "optimize_for",
    "go_package",
    "cc_generic_services",
    "java_generic_services",
    "py_generic_services",
    "php_generic_services",
    "deprecated",
    "cc_enable_arenas",
    "objc_class_prefix",
    "csharp_namespace",
    "swift_prefix",
    "php_class_prefix",
    "php_namespace",
    "php_metadata_namespace",
    "ruby_package",
    "features",
};

auto constexpr kWellKnownMessageOptions = std::array<std::string_view, 4>{
    "message_set_wire_format",
    "no_standard_descriptor_accessor",
    "deprecated",
    "map_entry",
};

auto constexpr kWellKnownFieldOptions = std::array<std::string_view, 10>{
    "ctype",         "packed", "jstype",       "lazy",      "unverified_lazy",
    "deprecated",    "weak",   "debug_redact", "retention", "targets",
};

auto constexpr kWellKnownEnumOptions = std::array<std::string_view, 2>{"allow_alias", "deprecated"};

auto constexpr kWellKnownEnumValueOptions = std::array<std::string_view, 2>{"deprecated",
                                                                           "debug_redact"};

auto constexpr kWellKnownServiceOptions = std::array<std::string_view, 1>{"deprecated"};

auto constexpr kWellKnownMethodOptions =
    std::array<std::string_view, 2>{"deprecated", "idempotency_level"};

absl::Span<std::string_view const> GetWellKnownOptionNames(OptionType const type) {
  switch (type) {
    case OptionType::kFile:
      return kWellKnownFileOptions;
    case OptionType::kMessage:
      return kWellKnownMessageOptions;
    case OptionType::kField:
      return kWellKnownFieldOptions;
    case OptionType::kEnum:
      return kWellKnownEnumOptions;
    case OptionType::kEnumValue:
      return kWellKnownEnumValueOptions;
    case OptionType::kService:
      return kWellKnownServiceOptions;
    case OptionType::kOneof:
      return {};
    case OptionType::kMethod:
      return kWellKnownMethodOptions;
  }
  LOG(FATAL) << "unexpected option type: " << static_cast<int>(type);
}

}  // namespace

std::string_view OptionTypeMessageName(OptionType const type) {
  switch (type) {
    case OptionType::kFile:
      return "google.protobuf.FileOptions";
    case OptionType::kMessage:
      return "google.protobuf.MessageOptions";
    case OptionType::kField:
      return "google.protobuf.FieldOptions";
    case OptionType::kEnum:
      return "google.protobuf.EnumOptions";
    case OptionType::kEnumValue:
      return "google.protobuf.EnumValueOptions";
    case OptionType::kService:
      return "google.protobuf.ServiceOptions";
    case OptionType::kOneof:
      return "google.protobuf.OneofOptions";
    case OptionType::kMethod:
      return "google.protobuf.MethodOptions";
  }
  LOG(FATAL) << "unexpected option type: " << static_cast<int>(type);
}

bool IsWellKnownOptionName(OptionType const type, std::string_view const name) {
  return absl::c_linear_search(GetWellKnownOptionNames(type), name);
}

OptionSpec::Builder& OptionSpec::Builder::SetOptionComment(std::vector<std::string> lines) {
  CHECK(type_ != OptionType::kField && type_ != OptionType::kEnumValue)
      << "comments aren't available for field options";
  comment_ = std::move(lines);
  return *this;
}

OptionSpec::Builder& OptionSpec::Builder::SetValue(FieldType const type, int32_t const value) {
  return SetScalarValue(type, value);
}

OptionSpec::Builder& OptionSpec::Builder::SetValue(FieldType const type, int64_t const value) {
  return SetScalarValue(type, value);
}

OptionSpec::Builder& OptionSpec::Builder::SetValue(FieldType const type, uint32_t const value) {
  return SetScalarValue(type, value);
}

OptionSpec::Builder& OptionSpec::Builder::SetValue(FieldType const type, uint64_t const value) {
  return SetScalarValue(type, value);
}

OptionSpec::Builder& OptionSpec::Builder::SetValue(FieldType const type, float const value) {
  return SetScalarValue(type, value);
}

OptionSpec::Builder& OptionSpec::Builder::SetValue(FieldType const type, double const value) {
  return SetScalarValue(type, value);
}

OptionSpec::Builder& OptionSpec::Builder::SetValue(FieldType const type, bool const value) {
  return SetScalarValue(type, value);
}

OptionSpec::Builder& OptionSpec::Builder::SetValue(FieldType const type,
                                                   std::string_view const value) {
  return SetScalarValue(type, value);
}

OptionSpec::Builder& OptionSpec::Builder::SetValue(FieldType const type,
                                                   std::vector<FieldValue> values) {
  CHECK(type == FieldType::kMessage)
      << "'" << FieldTypeName(type) << "' invalid type for a message value";
  value_ = std::move(values);
  value_type_ = type;
  return *this;
}

OptionSpec OptionSpec::Builder::Build() const {
  CHECK(value_type_.has_value()) << "option '" << name_ << "' has no value";
  return OptionSpec(type_, name_, comment_, value_type_.value(), value_);
}

std::string OptionSpec::FormattedName() const {
  if (IsWellKnownOptionName(type_, name_) || absl::StartsWith(name_, "(")) {
    return name_;
  } else {
    return absl::StrCat("(", name_, ")");
  }
}

void OptionSpec::Emit(ProtoWriter* const writer) const {
  if (!is_inline() && !comment_.empty()) {
    writer->EmitComment(comment_);
  }
  std::string const name = FormattedName();
  std::visit(absl::Overload{
                 [&](ScalarValue const& value) {
                   std::string const formatted = FormatScalarValue(value_type_, value);
                   if (is_inline()) {
                     writer->Emit(name, " = ", formatted);
                   } else {
                     writer->Emit("option ", name, " = ", formatted, ";\n");
                   }
                 },
                 [&](std::vector<FieldValue> const& values) {
                   if (is_inline()) {
                     writer->Emit(name, " = { ");
                     for (auto const& value : values) {
                       writer->Emit(value.name(), ": ", value.FormattedValue(), " ");
                     }
                     writer->Emit("}");
                   } else {
                     writer->Emit("option ", name, " = {\n");
                     {
                       ProtoWriter::IndentedScope is{writer};
                       for (auto const& value : values) {
                         writer->Emit(value.name(), ": ", value.FormattedValue(), "\n");
                       }
                     }
                     writer->Emit("};\n");
                   }
                 },
             },
             value_);
}

void EmitFieldOptions(absl::Span<OptionSpec const> const options, ProtoWriter* const writer) {
  if (options.empty()) {
    return;
  }
  writer->Emit(" [");
  for (size_t i = 0; i < options.size(); ++i) {
    if (i > 0) {
      writer->Emit(",");
      writer->EmitWrappingSpace();
    }
    options[i].Emit(writer);
  }
  writer->Emit("]");
}

void EmitOptions(absl::Span<OptionSpec const> const options, ProtoWriter* const writer) {
  for (auto const& option : options) {
    option.Emit(writer);
  }
}

}  // namespace protoscribe
