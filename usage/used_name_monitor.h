#ifndef __PROTOSCRIBE_USAGE_USED_NAME_MONITOR_H__
#define __PROTOSCRIBE_USAGE_USED_NAME_MONITOR_H__

#include <optional>
#include <string>
#include <string_view>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"

namespace protoscribe {
namespace usage {

// Tracks the type names (messages, enums, services, extensions) declared directly within one
// enclosing scope. Scopes don't nest: a nested message only checks its own immediate children.
class UsedNameMonitor {
 public:
  // Monitor for the file scope.
  explicit UsedNameMonitor() = default;

  // Monitor for the scope of the named message. `scope` is mentioned in error messages.
  explicit UsedNameMonitor(std::string_view const scope) : scope_(scope) {}

  UsedNameMonitor(UsedNameMonitor const&) = default;
  UsedNameMonitor& operator=(UsedNameMonitor const&) = default;
  UsedNameMonitor(UsedNameMonitor&&) noexcept = default;
  UsedNameMonitor& operator=(UsedNameMonitor&&) noexcept = default;

  // Records `name`, failing with `kAlreadyExists` if it's already taken.
  absl::Status Add(std::string_view name);

  absl::Status CheckUnused(std::string_view name) const;

  void Reset() { names_.clear(); }

 private:
  std::optional<std::string> scope_;
  absl::flat_hash_set<std::string> names_;
};

}  // namespace usage
}  // namespace protoscribe

#endif  // __PROTOSCRIBE_USAGE_USED_NAME_MONITOR_H__
