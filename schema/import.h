#ifndef __PROTOSCRIBE_SCHEMA_IMPORT_H__
#define __PROTOSCRIBE_SCHEMA_IMPORT_H__

#include <cstdint>
#include <string>
#include <string_view>

#include "writer/proto_writer.h"

namespace protoscribe {

// An `import` statement.
class ImportSpec {
 public:
  enum class Modifier : int8_t { kNone, kPublic, kWeak };

  // Check-fails unless `path` ends with `.proto`.
  explicit ImportSpec(std::string_view path) : ImportSpec(Modifier::kNone, path) {}
  explicit ImportSpec(Modifier modifier, std::string_view path);

  ImportSpec(ImportSpec const&) = default;
  ImportSpec& operator=(ImportSpec const&) = default;
  ImportSpec(ImportSpec&&) noexcept = default;
  ImportSpec& operator=(ImportSpec&&) noexcept = default;

  friend bool operator==(ImportSpec const& lhs, ImportSpec const& rhs) {
    return lhs.modifier_ == rhs.modifier_ && lhs.path_ == rhs.path_;
  }

  friend bool operator!=(ImportSpec const& lhs, ImportSpec const& rhs) { return !(lhs == rhs); }

  Modifier modifier() const { return modifier_; }
  std::string_view path() const { return path_; }

  void Emit(writer::ProtoWriter* writer) const;

 private:
  Modifier modifier_;
  std::string path_;
};

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_IMPORT_H__
