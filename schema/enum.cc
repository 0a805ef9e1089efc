#include "schema/enum.h"

#include <cstdint>
#include <string_view>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "common/utilities.h"
#include "schema/option.h"
#include "writer/proto_writer.h"

namespace protoscribe {

using ::protoscribe::writer::ProtoWriter;

EnumFieldSpec::Builder::Builder(std::string_view const name, int32_t const number)
    : name_(name), number_(number) {
  CHECK_GE(number, 0) << "field number may not be negative";
}

void EnumFieldSpec::Emit(ProtoWriter* const writer) const {
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  writer->Emit(name_, " = ", number_);
  EmitFieldOptions(options_, writer);
  writer->Emit(";\n");
}

absl::Status EnumSpec::Emit(ProtoWriter* const writer) const {
  used_fields_.Reset();
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  writer->Emit("enum ", name_, " {");
  if (!options_.empty()) {
    writer->Emit("\n");
    ProtoWriter::IndentedScope is{writer};
    EmitOptions(options_, writer);
  }
  if (!reservations_.empty()) {
    writer->Emit("\n");
    ProtoWriter::IndentedScope is{writer};
    for (auto const& reservation : reservations_) {
      RETURN_IF_ERROR(reservation.Register(&used_fields_));
      reservation.Emit(writer);
    }
  }
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
