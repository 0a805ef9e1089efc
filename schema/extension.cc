#include "schema/extension.h"

#include <string_view>
#include <variant>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "common/utilities.h"
#include "schema/import.h"
#include "schema/message_field.h"
#include "schema/option.h"
#include "writer/proto_writer.h"

namespace protoscribe {

namespace {

std::string_view constexpr kDescriptorProtoPath = "google/protobuf/descriptor.proto";

}  // namespace

using ::protoscribe::writer::ProtoWriter;

ExtensionSpec::Builder::Builder(OptionType const type)
    : name_(OptionTypeMessageName(type)), implicit_imports_{ImportSpec(kDescriptorProtoPath)} {}

void ExtensionSpec::Builder::AddField(MapFieldSpec const& field) {
  LOG(FATAL) << "complex fields not allowed (eg: oneofs or maps), got map field '" << field.name()
             << "'";
}

void ExtensionSpec::Builder::AddField(OneofFieldSpec const& field) {
  LOG(FATAL) << "complex fields not allowed (eg: oneofs or maps), got oneof '" << field.name()
             << "'";
}

void ExtensionSpec::Builder::AddField(MessageField const& field) {
  std::visit([this](auto const& spec) { AddField(spec); }, field);
}

absl::Status ExtensionSpec::Emit(ProtoWriter* const writer) const {
  used_fields_.Reset();
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  writer->Emit("extend ", name_, " {");
  if (!fields_.empty()) {
    writer->Emit("\n");
    ProtoWriter::IndentedScope is{writer};
    for (auto const& field : fields_) {
      RETURN_IF_ERROR(used_fields_.AddField(field.field_identity()));
      field.Emit(writer);
    }
  }
  writer->Emit("}\n");
  return absl::OkStatus();
}

}  // namespace protoscribe
