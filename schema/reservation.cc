#include "schema/reservation.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "usage/used_field_monitor.h"
#include "writer/proto_writer.h"

namespace protoscribe {

namespace {

// Removes duplicates while preserving the order of first occurrence.
template <typename Value>
std::vector<Value> Dedupe(std::vector<Value> values) {
  absl::flat_hash_set<Value> seen;
  std::vector<Value> result;
  result.reserve(values.size());
  for (auto& value : values) {
    if (seen.insert(value).second) {
      result.emplace_back(std::move(value));
    }
  }
  return result;
}

}  // namespace

FieldRange::FieldRange(int32_t const lo, int32_t const hi) : lo_(lo), hi_(hi) {
  CHECK_GT(lo, 0) << "low number must be positive";
  CHECK_GT(hi, 0) << "high number must be positive";
  CHECK_GT(hi, lo) << "high value must be higher than low value";
}

ReservationSpec::Builder::Builder(std::vector<int32_t> numbers)
    : numbers_(Dedupe(std::move(numbers))) {
  for (int32_t const number : numbers_) {
    CHECK_GT(number, 0) << "reserved field numbers must be positive";
  }
}

ReservationSpec::Builder::Builder(std::vector<std::string> names)
    : names_(Dedupe(std::move(names))) {}

ReservationSpec::Builder& ReservationSpec::Builder::AddRanges(
    std::vector<FieldRange> const& ranges) {
  CHECK(names_.empty()) << "ranges are only allowed when reserving field numbers";
  for (auto const& range : ranges) {
    ranges_.push_back(usage::NumberRange{.lo = range.lo(), .hi = range.hi()});
  }
  return *this;
}

absl::Status ReservationSpec::Register(usage::UsedFieldMonitor* const monitor) const {
  return monitor->AddReservation(numbers_, ranges_, names_);
}

void ReservationSpec::Emit(writer::ProtoWriter* const writer) const {
  if (!comment_.empty()) {
    writer->EmitComment(comment_);
  }
  std::vector<std::string> entries;
  entries.reserve(names_.size() + numbers_.size() + ranges_.size());
  for (auto const& name : names_) {
    entries.emplace_back(absl::StrCat("\"", name, "\""));
  }
  for (int32_t const number : numbers_) {
    entries.emplace_back(absl::StrCat(number));
  }
  for (auto const& range : ranges_) {
    entries.emplace_back(absl::StrCat(range.lo, " to ", range.hi));
  }
  writer->Emit("reserved ", absl::StrJoin(entries, ", "), ";\n");
}

}  // namespace protoscribe
