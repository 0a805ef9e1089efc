#ifndef __PROTOSCRIBE_COMMON_UTILITIES_H__
#define __PROTOSCRIBE_COMMON_UTILITIES_H__

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace protoscribe {
namespace util {

namespace internal {

inline absl::Status ReturnIfError_GetStatus(absl::Status const& status) { return status; }

template <typename T>
inline absl::Status ReturnIfError_GetStatus(absl::StatusOr<T> const& status_or) {
  return status_or.status();
}

}  // namespace internal

}  // namespace util
}  // namespace protoscribe

// Evaluates the expression assuming it returns an `absl::Status` or `absl::StatusOr`, and returns
// prematurely if the returned status is an error.
//
// Example:
//
//   absl::Status Foo();
//   absl::Status Baz();
//
//   absl::Status Bar() {
//     RETURN_IF_ERROR(Foo());
//     RETURN_IF_ERROR(Baz());
//     return absl::OkStatus();
//   }
//
// Note that if the expression returns an `absl::StatusOr` with an OK status, the wrapped value is
// lost.
#define RETURN_IF_ERROR(expression)                                          \
  do {                                                                       \
    auto status = (expression);                                              \
    if (!status.ok()) {                                                      \
      return ::protoscribe::util::internal::ReturnIfError_GetStatus(status); \
    }                                                                        \
  } while (false)

#endif  // __PROTOSCRIBE_COMMON_UTILITIES_H__
