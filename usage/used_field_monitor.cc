#include "usage/used_field_monitor.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"

namespace protoscribe {
namespace usage {

absl::Status UsedFieldMonitor::AddReservation(absl::Span<int32_t const> const numbers,
                                              absl::Span<NumberRange const> const ranges,
                                              absl::Span<std::string const> const names) {
  for (int32_t const number : numbers) {
    RETURN_IF_ERROR(CheckNumberUnused(number));
    reserved_ranges_.emplace(number, number);
  }
  for (auto const& range : ranges) {
    RETURN_IF_ERROR(CheckRangeUnused(range));
    reserved_ranges_.emplace(range.lo, range.hi);
  }
  for (auto const& name : names) {
    RETURN_IF_ERROR(CheckNameUnused(name, std::nullopt));
    names_.try_emplace(name, NameEntry{.number = std::nullopt, .reserved = true});
  }
  return absl::OkStatus();
}

absl::Status UsedFieldMonitor::AddField(FieldIdentity const& field) {
  RETURN_IF_ERROR(CheckUnused(field));
  names_.try_emplace(std::string(field.name),
                     NameEntry{.number = field.number, .reserved = false});
  if (field.number.has_value()) {
    numbers_.emplace(field.number.value(), std::string(field.name));
  }
  return absl::OkStatus();
}

absl::Status UsedFieldMonitor::AddFieldGroup(std::string_view const group_name,
                                             absl::Span<FieldIdentity const> const members) {
  RETURN_IF_ERROR(AddField(FieldIdentity{.name = group_name, .number = std::nullopt}));
  for (auto const& member : members) {
    RETURN_IF_ERROR(AddField(member));
  }
  return absl::OkStatus();
}

absl::Status UsedFieldMonitor::CheckUnused(FieldIdentity const& field) const {
  RETURN_IF_ERROR(CheckNameUnused(field.name, field.number));
  if (field.number.has_value()) {
    return CheckNumberUnused(field.number.value());
  } else {
    return absl::OkStatus();
  }
}

void UsedFieldMonitor::Reset() {
  names_.clear();
  numbers_.clear();
  reserved_ranges_.clear();
}

absl::Status UsedFieldMonitor::CheckNameUnused(std::string_view const name,
                                               std::optional<int32_t> const number) const {
  auto const it = names_.find(name);
  if (it == names_.end()) {
    return absl::OkStatus();
  }
  auto const& entry = it->second;
  if (entry.reserved) {
    return absl::AlreadyExistsError(
        absl::StrCat("field name '", name, "' is reserved and cannot be used"));
  }
  if (!entry.number.has_value()) {
    return absl::AlreadyExistsError(absl::StrCat("field name '", name, "' is not unique"));
  }
  if (number.has_value()) {
    return absl::AlreadyExistsError(absl::StrCat("field name '", name,
                                                 "' (number=", number.value(),
                                                 ") not unique, used by field number ",
                                                 entry.number.value()));
  } else {
    return absl::AlreadyExistsError(absl::StrCat(
        "field name '", name, "' not unique, used by field number ", entry.number.value()));
  }
}

absl::Status UsedFieldMonitor::CheckNumberUnused(int32_t const number) const {
  if (IsReservedNumber(number)) {
    return absl::AlreadyExistsError(
        absl::StrCat("field number ", number, " is reserved and cannot be used"));
  }
  auto const it = numbers_.find(number);
  if (it != numbers_.end()) {
    return absl::AlreadyExistsError(
        absl::StrCat("field number ", number, " already used by field named '", it->second, "'"));
  }
  return absl::OkStatus();
}

absl::Status UsedFieldMonitor::CheckRangeUnused(NumberRange const& range) const {
  // The first reserved number within the range is either the lower bound itself (when it falls in
  // an earlier interval) or the lower bound of an interval starting inside the range.
  if (IsReservedNumber(range.lo)) {
    return absl::AlreadyExistsError(
        absl::StrCat("field number ", range.lo, " is reserved and cannot be used"));
  }
  auto const reserved_it = reserved_ranges_.lower_bound(range.lo);
  if (reserved_it != reserved_ranges_.end() && reserved_it->first <= range.hi) {
    return absl::AlreadyExistsError(
        absl::StrCat("field number ", reserved_it->first, " is reserved and cannot be used"));
  }
  auto const used_it = numbers_.lower_bound(range.lo);
  if (used_it != numbers_.end() && used_it->first <= range.hi) {
    return absl::AlreadyExistsError(absl::StrCat("field number ", used_it->first,
                                                 " already used by field named '",
                                                 used_it->second, "'"));
  }
  return absl::OkStatus();
}

bool UsedFieldMonitor::IsReservedNumber(int32_t const number) const {
  auto it = reserved_ranges_.upper_bound(number);
  if (it == reserved_ranges_.begin()) {
    return false;
  }
  --it;
  return number <= it->second;
}

}  // namespace usage
}  // namespace protoscribe
