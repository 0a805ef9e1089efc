#ifndef __PROTOSCRIBE_SCHEMA_MESSAGE_H__
#define __PROTOSCRIBE_SCHEMA_MESSAGE_H__

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "schema/buildable.h"
#include "schema/enum.h"
#include "schema/message_field.h"
#include "schema/option.h"
#include "schema/reservation.h"
#include "usage/used_field_monitor.h"
#include "usage/used_name_monitor.h"
#include "writer/proto_writer.h"

namespace protoscribe {

// A message declaration.
//
// The body is rendered in a fixed order: options first, then reservations, then fields, nested
// messages and nested enums in the order they were added. Each of these is preceded by a blank
// line. Field names and numbers are checked against each other and against the reservations, and
// the names of nested types are checked against each other. The first conflict aborts the render.
//
// NOTE: the monitors are reset at every `Emit` call, so the same spec can be rendered multiple
// times but not concurrently.
class MessageSpec {
 public:
  // Nested messages are held by pointer because `MessageSpec` is recursive.
  using Element = std::variant<MessageFieldSpec, MapFieldSpec, OneofFieldSpec, EnumSpec,
                               std::shared_ptr<MessageSpec const>>;

  class Builder {
   public:
    explicit Builder(std::string_view const name) : name_(name) {}

    Builder& SetMessageComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    // Accepts plain fields, map fields and oneofs, built or not.
    template <typename... Fields>
    Builder& AddMessageFields(Fields&&... fields) {
      (AddField(internal::BuildIfNeeded(std::forward<Fields>(fields))), ...);
      return *this;
    }

    template <typename... Messages>
    Builder& AddMessages(Messages&&... messages) {
      (elements_.emplace_back(std::make_shared<MessageSpec const>(
           internal::BuildIfNeeded(std::forward<Messages>(messages)))),
       ...);
      return *this;
    }

    template <typename... Enums>
    Builder& AddEnums(Enums&&... enums) {
      (elements_.emplace_back(internal::BuildIfNeeded(std::forward<Enums>(enums))), ...);
      return *this;
    }

    template <typename... Reservations>
    Builder& AddReservations(Reservations&&... reservations) {
      internal::AppendBuilt(&reservations_, std::forward<Reservations>(reservations)...);
      return *this;
    }

    // Check-fails on options that aren't message options.
    template <typename... Options>
    Builder& AddMessageOptions(Options&&... options) {
      internal::AppendBuiltChecked(&options_, &CheckOption, std::forward<Options>(options)...);
      return *this;
    }

    MessageSpec Build() const;

   private:
    friend class MessageSpec;

    static void CheckOption(OptionSpec const& option) {
      CHECK(option.type() == OptionType::kMessage) << "option must be message type";
    }

    void AddField(MessageFieldSpec field) { elements_.emplace_back(std::move(field)); }
    void AddField(MapFieldSpec field) { elements_.emplace_back(std::move(field)); }
    void AddField(OneofFieldSpec field) { elements_.emplace_back(std::move(field)); }

    void AddField(MessageField field) {
      std::visit([this](auto&& spec) { AddField(std::move(spec)); }, std::move(field));
    }

    std::string name_;
    std::vector<std::string> comment_;
    std::vector<OptionSpec> options_;
    std::vector<ReservationSpec> reservations_;
    std::vector<Element> elements_;
  };

  // Copies own their nested messages, so a copy can be rendered independently of the original.
  MessageSpec(MessageSpec const& other);
  MessageSpec& operator=(MessageSpec const& other);
  MessageSpec(MessageSpec&&) noexcept = default;
  MessageSpec& operator=(MessageSpec&&) noexcept = default;

  std::string_view type_name() const { return name_; }

  absl::Status Emit(writer::ProtoWriter* writer) const;

 private:
  explicit MessageSpec(Builder const& builder)
      : name_(builder.name_),
        comment_(builder.comment_),
        options_(builder.options_),
        reservations_(builder.reservations_),
        elements_(CopyElements(builder.elements_)),
        used_names_(name_) {}

  static std::vector<Element> CopyElements(std::vector<Element> const& elements);

  // Registers the element with the monitors of this scope, then emits it.
  absl::Status EmitElement(Element const& element, writer::ProtoWriter* writer) const;

  bool is_empty() const {
    return options_.empty() && reservations_.empty() && elements_.empty();
  }

  std::string name_;
  std::vector<std::string> comment_;
  std::vector<OptionSpec> options_;
  std::vector<ReservationSpec> reservations_;
  std::vector<Element> elements_;

  usage::UsedFieldMonitor mutable used_fields_;
  usage::UsedNameMonitor mutable used_names_;
};

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_MESSAGE_H__
