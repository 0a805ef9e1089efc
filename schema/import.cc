#include "schema/import.h"

#include <string_view>

#include "absl/log/check.h"
#include "absl/strings/match.h"
#include "writer/proto_writer.h"

namespace protoscribe {

ImportSpec::ImportSpec(Modifier const modifier, std::string_view const path)
    : modifier_(modifier), path_(path) {
  CHECK(absl::EndsWith(path, ".proto")) << "path must be a file ending with .proto";
}

void ImportSpec::Emit(writer::ProtoWriter* const writer) const {
  switch (modifier_) {
    case Modifier::kNone:
      writer->Emit("import \"", path_, "\";\n");
      break;
    case Modifier::kPublic:
      writer->Emit("import public \"", path_, "\";\n");
      break;
    case Modifier::kWeak:
      writer->Emit("import weak \"", path_, "\";\n");
      break;
  }
}

}  // namespace protoscribe
