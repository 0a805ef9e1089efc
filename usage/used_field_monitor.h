#ifndef __PROTOSCRIBE_USAGE_USED_FIELD_MONITOR_H__
#define __PROTOSCRIBE_USAGE_USED_FIELD_MONITOR_H__

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/types/span.h"

namespace protoscribe {
namespace usage {

// Identifies a declared field for collision purposes. Fields without a number (e.g. rpc methods or
// oneof group names) are checked by name only.
struct FieldIdentity {
  std::string_view name;
  std::optional<int32_t> number;
};

// Inclusive range of reserved field numbers.
struct NumberRange {
  int32_t lo;
  int32_t hi;
};

// Tracks the field names and numbers used within a single scope (message, enum, service, extension)
// and reports collisions and reservation violations as `kAlreadyExists` errors.
//
// The monitor is owned by the node of the scope and is reset at the start of every render pass, so
// rendering the same model twice yields the same result.
class UsedFieldMonitor {
 public:
  explicit UsedFieldMonitor() = default;

  UsedFieldMonitor(UsedFieldMonitor const&) = default;
  UsedFieldMonitor& operator=(UsedFieldMonitor const&) = default;
  UsedFieldMonitor(UsedFieldMonitor&&) noexcept = default;
  UsedFieldMonitor& operator=(UsedFieldMonitor&&) noexcept = default;

  // Records a reservation block. Fails if any of the reserved numbers or names was already
  // registered, either by a field or by an earlier reservation. Ranges are stored as intervals.
  absl::Status AddReservation(absl::Span<int32_t const> numbers,
                              absl::Span<NumberRange const> ranges,
                              absl::Span<std::string const> names);

  // Records a field, failing if its name or number is already taken.
  absl::Status AddField(FieldIdentity const& field);

  // Records the name of a field group (i.e. a oneof) followed by all of its members. The group
  // name and the member names share the namespace of the scope.
  absl::Status AddFieldGroup(std::string_view group_name, absl::Span<FieldIdentity const> members);

  // Checks that `field` doesn't collide with anything registered so far, without recording it.
  absl::Status CheckUnused(FieldIdentity const& field) const;

  void Reset();

 private:
  struct NameEntry {
    std::optional<int32_t> number;
    bool reserved;
  };

  absl::Status CheckNameUnused(std::string_view name, std::optional<int32_t> number) const;
  absl::Status CheckNumberUnused(int32_t number) const;
  absl::Status CheckRangeUnused(NumberRange const& range) const;

  bool IsReservedNumber(int32_t number) const;

  absl::flat_hash_map<std::string, NameEntry> names_;

  // Numbers used by actual fields, mapped to the name of the field.
  absl::btree_map<int32_t, std::string> numbers_;

  // Reserved intervals, keyed by lower bound and mapped to the (inclusive) upper bound. Intervals
  // never overlap.
  absl::btree_map<int32_t, int32_t> reserved_ranges_;
};

}  // namespace usage
}  // namespace protoscribe

#endif  // __PROTOSCRIBE_USAGE_USED_FIELD_MONITOR_H__
