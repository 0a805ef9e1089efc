#ifndef __PROTOSCRIBE_SCHEMA_RESERVATION_H__
#define __PROTOSCRIBE_SCHEMA_RESERVATION_H__

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "usage/used_field_monitor.h"
#include "writer/proto_writer.h"

namespace protoscribe {

// Inclusive range of field numbers, rendered as `lo to hi`.
class FieldRange {
 public:
  // Check-fails unless `0 < lo < hi`.
  explicit FieldRange(int32_t lo, int32_t hi);

  int32_t lo() const { return lo_; }
  int32_t hi() const { return hi_; }

 private:
  int32_t lo_;
  int32_t hi_;
};

// A `reserved` statement. A reservation holds either field numbers (single numbers and ranges) or
// field names, never both.
class ReservationSpec {
 public:
  class Builder {
   public:
    // Check-fails for a non-positive number.
    explicit Builder(std::vector<int32_t> numbers);

    explicit Builder(std::vector<std::string> names);

    Builder& SetReservationComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    // Check-fails if this is a name reservation.
    Builder& AddRanges(std::vector<FieldRange> const& ranges);

    ReservationSpec Build() const { return ReservationSpec(numbers_, ranges_, names_, comment_); }

   private:
    std::vector<int32_t> numbers_;
    std::vector<usage::NumberRange> ranges_;
    std::vector<std::string> names_;
    std::vector<std::string> comment_;
  };

  // Shorthands for reserving field numbers and field names respectively. Duplicates are dropped.
  static Builder Numbers(std::vector<int32_t> numbers) { return Builder(std::move(numbers)); }
  static Builder Names(std::vector<std::string> names) { return Builder(std::move(names)); }

  ReservationSpec(ReservationSpec const&) = default;
  ReservationSpec& operator=(ReservationSpec const&) = default;
  ReservationSpec(ReservationSpec&&) noexcept = default;
  ReservationSpec& operator=(ReservationSpec&&) noexcept = default;

  // Registers the reserved names and numbers with the monitor of the enclosing scope.
  absl::Status Register(usage::UsedFieldMonitor* monitor) const;

  void Emit(writer::ProtoWriter* writer) const;

 private:
  explicit ReservationSpec(std::vector<int32_t> numbers, std::vector<usage::NumberRange> ranges,
                           std::vector<std::string> names, std::vector<std::string> comment)
      : numbers_(std::move(numbers)),
        ranges_(std::move(ranges)),
        names_(std::move(names)),
        comment_(std::move(comment)) {}

  std::vector<int32_t> numbers_;
  std::vector<usage::NumberRange> ranges_;
  std::vector<std::string> names_;
  std::vector<std::string> comment_;
};

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_RESERVATION_H__
