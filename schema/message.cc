#include "schema/message.h"

#include <memory>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "common/utilities.h"
#include "schema/capabilities.h"
#include "schema/option.h"
#include "writer/proto_writer.h"

namespace protoscribe {

using ::protoscribe::writer::ProtoWriter;

MessageSpec MessageSpec::Builder::Build() const { return MessageSpec(*this); }

MessageSpec::MessageSpec(MessageSpec const& other)
    : name_(other.name_),
      comment_(other.comment_),
      options_(other.options_),
      reservations_(other.reservations_),
      elements_(CopyElements(other.elements_)),
      used_names_(name_) {}

MessageSpec& MessageSpec::operator=(MessageSpec const& other) {
  if (this != &other) {
    *this = MessageSpec(other);
  }
  return *this;
}

std::vector<MessageSpec::Element> MessageSpec::CopyElements(std::vector<Element> const& elements) {
  std::vector<Element> result;
  result.reserve(elements.size());
  for (auto const& element : elements) {
    if (auto const* const nested = std::get_if<std::shared_ptr<MessageSpec const>>(&element)) {
      result.emplace_back(std::make_shared<MessageSpec const>(**nested));
    } else {
      result.emplace_back(element);
    }
  }
  return result;
}

absl::Status MessageSpec::Emit(ProtoWriter* const writer) const {
  used_fields_.Reset();
  used_names_.Reset();
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  writer->Emit("message ", name_, " {");
  if (is_empty()) {
    writer->Emit("}\n");
    return absl::OkStatus();
  }
  writer->Emit("\n");
  {
    ProtoWriter::IndentedScope is{writer};
    if (!options_.empty()) {
      writer->Emit("\n");
      EmitOptions(options_, writer);
    }
    if (!reservations_.empty()) {
      writer->Emit("\n");
      for (auto const& reservation : reservations_) {
        RETURN_IF_ERROR(reservation.Register(&used_fields_));
        reservation.Emit(writer);
      }
    }
    for (auto const& element : elements_) {
      writer->Emit("\n");
      RETURN_IF_ERROR(EmitElement(element, writer));
    }
  }
  writer->Emit("}\n");
  return absl::OkStatus();
}

absl::Status MessageSpec::EmitElement(Element const& element, ProtoWriter* const writer) const {
  return std::visit(
      [&](auto const& value) -> absl::Status {
        auto const& spec = internal::Unwrap(value);
        RETURN_IF_ERROR(internal::RegisterUsage(spec, &used_names_, &used_fields_));
        return internal::EmitElement(spec, writer);
      },
      element);
}

}  // namespace protoscribe
