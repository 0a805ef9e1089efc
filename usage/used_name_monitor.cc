#include "usage/used_name_monitor.h"

#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "common/utilities.h"

namespace protoscribe {
namespace usage {

absl::Status UsedNameMonitor::Add(std::string_view const name) {
  RETURN_IF_ERROR(CheckUnused(name));
  names_.emplace(name);
  return absl::OkStatus();
}

absl::Status UsedNameMonitor::CheckUnused(std::string_view const name) const {
  if (!names_.contains(name)) {
    return absl::OkStatus();
  }
  if (scope_.has_value()) {
    return absl::AlreadyExistsError(
        absl::StrCat("'", name, "' name already used in '", scope_.value(), "'"));
  } else {
    return absl::AlreadyExistsError(absl::StrCat("'", name, "' name already used"));
  }
}

}  // namespace usage
}  // namespace protoscribe
