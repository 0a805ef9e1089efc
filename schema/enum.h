#ifndef __PROTOSCRIBE_SCHEMA_ENUM_H__
#define __PROTOSCRIBE_SCHEMA_ENUM_H__

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "schema/buildable.h"
#include "schema/option.h"
#include "schema/reservation.h"
#include "usage/used_field_monitor.h"
#include "writer/proto_writer.h"

namespace protoscribe {

// A value of an enum, e.g. `FOO = 1 [deprecated = true];`.
class EnumFieldSpec {
 public:
  class Builder {
   public:
    // Check-fails if `number` is negative.
    explicit Builder(std::string_view name, int32_t number);

    Builder& SetFieldComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    // Accepts enum value options or builders thereof. Check-fails on options of other kinds.
    template <typename... Options>
    Builder& AddFieldOptions(Options&&... options) {
      internal::AppendBuiltChecked(&options_, &CheckOption, std::forward<Options>(options)...);
      return *this;
    }

    EnumFieldSpec Build() const { return EnumFieldSpec(name_, number_, comment_, options_); }

   private:
    static void CheckOption(OptionSpec const& option) {
      CHECK(option.type() == OptionType::kEnumValue) << "option must be enum value type";
    }

    std::string name_;
    int32_t number_;
    std::vector<std::string> comment_;
    std::vector<OptionSpec> options_;
  };

  EnumFieldSpec(EnumFieldSpec const&) = default;
  EnumFieldSpec& operator=(EnumFieldSpec const&) = default;
  EnumFieldSpec(EnumFieldSpec&&) noexcept = default;
  EnumFieldSpec& operator=(EnumFieldSpec&&) noexcept = default;

  std::string_view name() const { return name_; }
  int32_t number() const { return number_; }

  usage::FieldIdentity field_identity() const {
    return usage::FieldIdentity{.name = name_, .number = number_};
  }

  void Emit(writer::ProtoWriter* writer) const;

 private:
  explicit EnumFieldSpec(std::string name, int32_t const number, std::vector<std::string> comment,
                         std::vector<OptionSpec> options)
      : name_(std::move(name)),
        number_(number),
        comment_(std::move(comment)),
        options_(std::move(options)) {}

  std::string name_;
  int32_t number_;
  std::vector<std::string> comment_;
  std::vector<OptionSpec> options_;
};

// An enum declaration. Renders options first, then reservations, then the values in declaration
// order, checking values against each other and against the reservations.
//
// NOTE: the field monitor is reset at every `Emit` call, so the same spec can be rendered multiple
// times but not concurrently.
class EnumSpec {
 public:
  class Builder {
   public:
    explicit Builder(std::string_view const name) : name_(name) {}

    Builder& SetEnumComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    template <typename... Fields>
    Builder& AddEnumFields(Fields&&... fields) {
      internal::AppendBuilt(&fields_, std::forward<Fields>(fields)...);
      return *this;
    }

    template <typename... Reservations>
    Builder& AddReservations(Reservations&&... reservations) {
      internal::AppendBuilt(&reservations_, std::forward<Reservations>(reservations)...);
      return *this;
    }

    // Check-fails on options that aren't enum options.
    template <typename... Options>
    Builder& AddEnumOptions(Options&&... options) {
      internal::AppendBuiltChecked(&options_, &CheckOption, std::forward<Options>(options)...);
      return *this;
    }

    EnumSpec Build() const { return EnumSpec(name_, comment_, fields_, reservations_, options_); }

   private:
    static void CheckOption(OptionSpec const& option) {
      CHECK(option.type() == OptionType::kEnum) << "option must be enum type";
    }

    std::string name_;
    std::vector<std::string> comment_;
    std::vector<EnumFieldSpec> fields_;
    std::vector<ReservationSpec> reservations_;
    std::vector<OptionSpec> options_;
  };

  EnumSpec(EnumSpec const&) = default;
  EnumSpec& operator=(EnumSpec const&) = default;
  EnumSpec(EnumSpec&&) noexcept = default;
  EnumSpec& operator=(EnumSpec&&) noexcept = default;

  std::string_view type_name() const { return name_; }

  absl::Status Emit(writer::ProtoWriter* writer) const;

 private:
  explicit EnumSpec(std::string name, std::vector<std::string> comment,
                    std::vector<EnumFieldSpec> fields, std::vector<ReservationSpec> reservations,
                    std::vector<OptionSpec> options)
      : name_(std::move(name)),
        comment_(std::move(comment)),
        fields_(std::move(fields)),
        reservations_(std::move(reservations)),
        options_(std::move(options)) {}

  std::string name_;
  std::vector<std::string> comment_;
  std::vector<EnumFieldSpec> fields_;
  std::vector<ReservationSpec> reservations_;
  std::vector<OptionSpec> options_;

  usage::UsedFieldMonitor mutable used_fields_;
};

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_ENUM_H__
