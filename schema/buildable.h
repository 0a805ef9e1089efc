#ifndef __PROTOSCRIBE_SCHEMA_BUILDABLE_H__
#define __PROTOSCRIBE_SCHEMA_BUILDABLE_H__

#include <type_traits>
#include <utility>
#include <vector>

namespace protoscribe {
namespace internal {

template <typename T, typename Enable = void>
struct IsBuilder : public std::false_type {};

template <typename T>
struct IsBuilder<T, std::void_t<decltype(std::declval<T const&>().Build())>>
    : public std::true_type {};

template <typename T>
inline bool constexpr IsBuilderV = IsBuilder<std::decay_t<T>>::value;

// Returns `value.Build()` if `value` is a builder, or `value` itself if it's already built. Adders
// use it so that callers can pass specs and builders interchangeably.
template <typename T>
decltype(auto) BuildIfNeeded(T&& value) {
  if constexpr (IsBuilderV<T>) {
    return std::forward<T>(value).Build();
  } else {
    return std::forward<T>(value);
  }
}

// Builds each argument as needed and appends the results to `specs`.
template <typename Spec, typename... Args>
void AppendBuilt(std::vector<Spec>* const specs, Args&&... args) {
  (specs->emplace_back(BuildIfNeeded(std::forward<Args>(args))), ...);
}

// Like `AppendBuilt` but runs `check` on each built spec before appending it. `check` is supposed
// to check-fail on invalid specs.
template <typename Spec, typename Check, typename... Args>
void AppendBuiltChecked(std::vector<Spec>* const specs, Check const& check, Args&&... args) {
  (
      [&](auto&& spec) {
        check(spec);
        specs->emplace_back(std::forward<decltype(spec)>(spec));
      }(BuildIfNeeded(std::forward<Args>(args))),
      ...);
}

}  // namespace internal
}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_BUILDABLE_H__
