#ifndef __PROTOSCRIBE_SCHEMA_CAPABILITIES_H__
#define __PROTOSCRIBE_SCHEMA_CAPABILITIES_H__

#include <memory>
#include <type_traits>
#include <utility>

#include "absl/status/status.h"
#include "common/utilities.h"
#include "usage/used_field_monitor.h"
#include "usage/used_name_monitor.h"
#include "writer/proto_writer.h"

namespace protoscribe {
namespace internal {

// Optional capabilities of the elements of a scope, detected at compile time:
//
//   * named types (messages, enums, services, extensions) expose `type_name()` and are registered
//     with the name monitor of the enclosing scope;
//   * single fields (plain fields, map fields, enum values, rpcs) expose `field_identity()` and are
//     registered with the field monitor;
//   * field groups (oneofs) expose `group_name()` and `member_identities()` and are registered
//     with the field monitor, name first;
//   * some top-level elements (extensions) expose `implicit_imports()`, the imports they require.

template <typename T, typename Enable = void>
struct IsNamedType : public std::false_type {};

template <typename T>
struct IsNamedType<T, std::void_t<decltype(std::declval<T const&>().type_name())>>
    : public std::true_type {};

template <typename T, typename Enable = void>
struct IsSingleField : public std::false_type {};

template <typename T>
struct IsSingleField<T, std::void_t<decltype(std::declval<T const&>().field_identity())>>
    : public std::true_type {};

template <typename T, typename Enable = void>
struct IsFieldGroup : public std::false_type {};

template <typename T>
struct IsFieldGroup<T, std::void_t<decltype(std::declval<T const&>().group_name()),
                                   decltype(std::declval<T const&>().member_identities())>>
    : public std::true_type {};

template <typename T, typename Enable = void>
struct ExportsImports : public std::false_type {};

template <typename T>
struct ExportsImports<T, std::void_t<decltype(std::declval<T const&>().implicit_imports())>>
    : public std::true_type {};

// Dereferences smart pointers, used for recursive elements (nested messages).
template <typename T>
T const& Unwrap(T const& element) {
  return element;
}

template <typename T>
T const& Unwrap(std::shared_ptr<T const> const& element) {
  return *element;
}

// Registers `element` with whichever monitors apply to it. Either monitor may be null if the scope
// doesn't have one, in which case the element mustn't need it.
template <typename Element>
absl::Status RegisterUsage(Element const& element, usage::UsedNameMonitor* const names,
                           usage::UsedFieldMonitor* const fields) {
  if constexpr (IsNamedType<Element>::value) {
    RETURN_IF_ERROR(names->Add(element.type_name()));
  }
  if constexpr (IsSingleField<Element>::value) {
    RETURN_IF_ERROR(fields->AddField(element.field_identity()));
  }
  if constexpr (IsFieldGroup<Element>::value) {
    RETURN_IF_ERROR(fields->AddFieldGroup(element.group_name(), element.member_identities()));
  }
  return absl::OkStatus();
}

// Emits `element`. Leaf elements can't fail, scopes return the first usage error they run into.
template <typename Element>
absl::Status EmitElement(Element const& element, writer::ProtoWriter* const writer) {
  if constexpr (std::is_void_v<decltype(element.Emit(writer))>) {
    element.Emit(writer);
    return absl::OkStatus();
  } else {
    return element.Emit(writer);
  }
}

}  // namespace internal
}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_CAPABILITIES_H__
