#include "schema/proto_file.h"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/utilities.h"
#include "schema/capabilities.h"
#include "schema/import.h"
#include "schema/option.h"
#include "writer/proto_writer.h"
#include "writer/sink.h"

namespace protoscribe {

using ::protoscribe::writer::ProtoWriter;
using ::protoscribe::writer::Sink;
using ::protoscribe::writer::StringSink;

ProtoFile ProtoFile::Builder::Build() const { return ProtoFile(*this); }

std::vector<ImportSpec> ProtoFile::SortedImports() const {
  absl::btree_map<std::string, ImportSpec> imports;
  auto const add = [&imports](ImportSpec const& import) {
    auto const [it, inserted] = imports.try_emplace(std::string(import.path()), import);
    if (!inserted && it->second.modifier() != import.modifier()) {
      LOG(WARNING) << "\"" << import.path()
                   << "\" is imported more than once with different modifiers, keeping the first";
    }
  };
  for (auto const& import : imports_) {
    add(import);
  }
  for (auto const& element : elements_) {
    std::visit(
        [&](auto const& spec) {
          if constexpr (internal::ExportsImports<std::decay_t<decltype(spec)>>::value) {
            for (auto const& import : spec.implicit_imports()) {
              add(import);
            }
          }
        },
        element);
  }
  std::vector<ImportSpec> result;
  result.reserve(imports.size());
  for (auto& [path, import] : imports) {
    result.emplace_back(std::move(import));
  }
  return result;
}

absl::Status ProtoFile::Emit(ProtoWriter* const writer) const {
  used_names_.Reset();
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  writer->Emit("syntax = \"proto3\";\n");
  if (package_name_.has_value()) {
    writer->Emit("\npackage ", package_name_.value(), ";\n");
  }
  auto const imports = SortedImports();
  if (!imports.empty()) {
    writer->Emit("\n");
    for (auto const& import : imports) {
      import.Emit(writer);
    }
  }
  if (!options_.empty()) {
    writer->Emit("\n");
    EmitOptions(options_, writer);
  }
  for (auto const& element : elements_) {
    writer->Emit("\n");
    RETURN_IF_ERROR(EmitElement(element, writer));
  }
  return absl::OkStatus();
}

absl::Status ProtoFile::EmitElement(Element const& element, ProtoWriter* const writer) const {
  return std::visit(
      [&](auto const& spec) -> absl::Status {
        RETURN_IF_ERROR(internal::RegisterUsage(spec, &used_names_, /*fields=*/nullptr));
        return internal::EmitElement(spec, writer);
      },
      element);
}

absl::Status ProtoFile::WriteTo(Sink* const sink) const {
  return WriteTo(sink, ProtoWriter::Options());
}

absl::Status ProtoFile::WriteTo(Sink* const sink, ProtoWriter::Options const& options) const {
  ProtoWriter writer{sink, options};
  RETURN_IF_ERROR(Emit(&writer));
  writer.Flush();
  return absl::OkStatus();
}

absl::StatusOr<std::string> ProtoFile::ToString() const {
  std::string output;
  StringSink sink{&output};
  RETURN_IF_ERROR(WriteTo(&sink));
  return std::move(output);
}

absl::Status ProtoFile::Validate() const {
  ProtoWriter writer = ProtoWriter::Discarding();
  return Emit(&writer);
}

}  // namespace protoscribe
