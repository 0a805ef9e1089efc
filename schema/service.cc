#include "schema/service.h"

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "common/utilities.h"
#include "schema/option.h"
#include "writer/proto_writer.h"

namespace protoscribe {

using ::protoscribe::writer::ProtoWriter;

RpcFieldSpec RpcFieldSpec::Builder::Build() const {
  CHECK(request_.has_value()) << "request message must be set";
  CHECK(response_.has_value()) << "response message must be set";
  return RpcFieldSpec(*this);
}

RpcFieldSpec::RpcFieldSpec(Builder const& builder)
    : name_(builder.name_),
      comment_(builder.comment_),
      request_(absl::StrCat(builder.request_->streaming ? "stream " : "",
                            builder.request_->message_name)),
      response_(absl::StrCat(builder.response_->streaming ? "stream " : "",
                             builder.response_->message_name)),
      options_(builder.options_) {}

void RpcFieldSpec::Emit(ProtoWriter* const writer) const {
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  writer->Emit("rpc ", name_, " (", request_, ") returns (", response_, ")");
  if (options_.empty()) {
    writer->Emit(";\n");
    return;
  }
  writer->Emit(" {\n");
  {
    ProtoWriter::IndentedScope is{writer};
    EmitOptions(options_, writer);
  }
  writer->Emit("}\n");
}

absl::Status ServiceSpec::Emit(ProtoWriter* const writer) const {
  used_fields_.Reset();
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  writer->Emit("service ", name_, " {");
  if (!options_.empty()) {
    writer->Emit("\n");
    ProtoWriter::IndentedScope is{writer};
    EmitOptions(options_, writer);
  }
  if (!rpcs_.empty()) {
    writer->Emit("\n");
    ProtoWriter::IndentedScope is{writer};
    for (auto const& rpc : rpcs_) {
      RETURN_IF_ERROR(used_fields_.AddField(rpc.field_identity()));
      rpc.Emit(writer);
    }
  }
  writer->Emit("}\n");
  return absl::OkStatus();
}

}  // namespace protoscribe
