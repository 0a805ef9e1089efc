#ifndef __PROTOSCRIBE_SCHEMA_EXTENSION_H__
#define __PROTOSCRIBE_SCHEMA_EXTENSION_H__

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "schema/buildable.h"
#include "schema/import.h"
#include "schema/message_field.h"
#include "schema/option.h"
#include "usage/used_field_monitor.h"
#include "writer/proto_writer.h"

namespace protoscribe {

// An `extend` block adding custom options to one of the descriptor option messages, e.g.
// `extend google.protobuf.FieldOptions { ... }`.
//
// Extensions implicitly require `google/protobuf/descriptor.proto`; the enclosing file adds the
// import automatically.
class ExtensionSpec {
 public:
  class Builder {
   public:
    explicit Builder(OptionType type);

    Builder& SetExtensionComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    // Accepts plain fields (or builders thereof). Check-fails on map fields and oneofs.
    template <typename... Fields>
    Builder& AddExtensionFields(Fields&&... fields) {
      (AddField(internal::BuildIfNeeded(std::forward<Fields>(fields))), ...);
      return *this;
    }

    ExtensionSpec Build() const {
      return ExtensionSpec(name_, implicit_imports_, comment_, fields_);
    }

   private:
    void AddField(MessageFieldSpec const& field) { fields_.push_back(field); }
    void AddField(MapFieldSpec const& field);
    void AddField(OneofFieldSpec const& field);
    void AddField(MessageField const& field);

    std::string name_;
    std::vector<ImportSpec> implicit_imports_;
    std::vector<std::string> comment_;
    std::vector<MessageFieldSpec> fields_;
  };

  ExtensionSpec(ExtensionSpec const&) = default;
  ExtensionSpec& operator=(ExtensionSpec const&) = default;
  ExtensionSpec(ExtensionSpec&&) noexcept = default;
  ExtensionSpec& operator=(ExtensionSpec&&) noexcept = default;

  // The name of the extended message, e.g. "google.protobuf.MessageOptions".
  std::string_view type_name() const { return name_; }

  std::vector<ImportSpec> const& implicit_imports() const { return implicit_imports_; }

  absl::Status Emit(writer::ProtoWriter* writer) const;

 private:
  explicit ExtensionSpec(std::string name, std::vector<ImportSpec> implicit_imports,
                         std::vector<std::string> comment, std::vector<MessageFieldSpec> fields)
      : name_(std::move(name)),
        implicit_imports_(std::move(implicit_imports)),
        comment_(std::move(comment)),
        fields_(std::move(fields)) {}

  std::string name_;
  std::vector<ImportSpec> implicit_imports_;
  std::vector<std::string> comment_;
  std::vector<MessageFieldSpec> fields_;

  usage::UsedFieldMonitor mutable used_fields_;
};

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_EXTENSION_H__
