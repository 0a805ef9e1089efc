#ifndef __PROTOSCRIBE_SCHEMA_PROTO_FILE_H__
#define __PROTOSCRIBE_SCHEMA_PROTO_FILE_H__

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "schema/buildable.h"
#include "schema/enum.h"
#include "schema/extension.h"
#include "schema/import.h"
#include "schema/message.h"
#include "schema/option.h"
#include "schema/service.h"
#include "usage/used_name_monitor.h"
#include "writer/proto_writer.h"
#include "writer/sink.h"

namespace protoscribe {

// A whole `.proto` file, the root of the model.
//
// The file is rendered as: leading comment, syntax statement, package, imports, file options, and
// finally the top-level declarations in the order they were added, each one preceded by a blank
// line. Imports include the ones declared explicitly and the ones required by the declarations
// (e.g. extensions need `descriptor.proto`); they are deduplicated by path and sorted.
//
// Rendering fails with `kAlreadyExists` on the first name or field number conflict found anywhere
// in the tree. A failed render may have written part of the output to the sink already.
//
// NOTE: rendering resets the usage monitors held by the model, so the same `ProtoFile` can be
// rendered multiple times, with the same result, but not concurrently.
class ProtoFile {
 public:
  using Element = std::variant<MessageSpec, EnumSpec, ServiceSpec, ExtensionSpec>;

  class Builder {
   public:
    explicit Builder() = default;

    Builder& SetFileComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    Builder& SetPackageName(std::string_view const package_name) {
      package_name_.emplace(package_name);
      return *this;
    }

    template <typename... Imports>
    Builder& AddImports(Imports&&... imports) {
      internal::AppendBuilt(&imports_, std::forward<Imports>(imports)...);
      return *this;
    }

    template <typename... Messages>
    Builder& AddMessages(Messages&&... messages) {
      return AddElements(std::forward<Messages>(messages)...);
    }

    template <typename... Enums>
    Builder& AddEnums(Enums&&... enums) {
      return AddElements(std::forward<Enums>(enums)...);
    }

    template <typename... Services>
    Builder& AddServices(Services&&... services) {
      return AddElements(std::forward<Services>(services)...);
    }

    template <typename... Extensions>
    Builder& AddExtensions(Extensions&&... extensions) {
      return AddElements(std::forward<Extensions>(extensions)...);
    }

    // Check-fails on options that aren't file options.
    template <typename... Options>
    Builder& AddFileOptions(Options&&... options) {
      internal::AppendBuiltChecked(&options_, &CheckOption, std::forward<Options>(options)...);
      return *this;
    }

    ProtoFile Build() const;

   private:
    friend class ProtoFile;

    static void CheckOption(OptionSpec const& option) {
      CHECK(option.type() == OptionType::kFile) << "option must be file type";
    }

    template <typename... Args>
    Builder& AddElements(Args&&... args) {
      internal::AppendBuilt(&elements_, std::forward<Args>(args)...);
      return *this;
    }

    std::vector<std::string> comment_;
    std::optional<std::string> package_name_;
    std::vector<ImportSpec> imports_;
    std::vector<OptionSpec> options_;
    std::vector<Element> elements_;
  };

  ProtoFile(ProtoFile const&) = default;
  ProtoFile& operator=(ProtoFile const&) = default;
  ProtoFile(ProtoFile&&) noexcept = default;
  ProtoFile& operator=(ProtoFile&&) noexcept = default;

  // Returns the imports of the file as they're rendered: explicit and implicit ones, deduplicated
  // by path and sorted by path. For duplicate paths the first declaration wins, explicit imports
  // coming before implicit ones.
  std::vector<ImportSpec> SortedImports() const;

  absl::Status Emit(writer::ProtoWriter* writer) const;

  // Renders the file to `sink` with default formatting options.
  absl::Status WriteTo(writer::Sink* sink) const;

  absl::Status WriteTo(writer::Sink* sink, writer::ProtoWriter::Options const& options) const;

  // Renders the file to a string. The output is the same as `WriteTo`.
  absl::StatusOr<std::string> ToString() const;

  // Runs all the render time checks without producing any output.
  absl::Status Validate() const;

 private:
  // Registers a top-level declaration with the name monitor of the file, then emits it.
  absl::Status EmitElement(Element const& element, writer::ProtoWriter* writer) const;

  explicit ProtoFile(Builder const& builder)
      : comment_(builder.comment_),
        package_name_(builder.package_name_),
        imports_(builder.imports_),
        options_(builder.options_),
        elements_(builder.elements_) {}

  std::vector<std::string> comment_;
  std::optional<std::string> package_name_;
  std::vector<ImportSpec> imports_;
  std::vector<OptionSpec> options_;
  std::vector<Element> elements_;

  usage::UsedNameMonitor mutable used_names_;
};

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_PROTO_FILE_H__
