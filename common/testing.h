#ifndef __PROTOSCRIBE_COMMON_TESTING_H__
#define __PROTOSCRIBE_COMMON_TESTING_H__

#include <string>
#include <type_traits>

#include "absl/status/status.h"           // IWYU pragma: export
#include "absl/status/status_matchers.h"  // IWYU pragma: export
#include "absl/status/statusor.h"         // IWYU pragma: export
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "writer/proto_writer.h"
#include "writer/sink.h"

namespace testing {

// Renders a single schema node with a default-configured `ProtoWriter` and returns the text. Works
// both with nodes whose `Emit` can fail and with nodes whose `Emit` returns nothing.
template <typename Node>
absl::StatusOr<std::string> RenderToString(Node const& node) {
  std::string output;
  ::protoscribe::writer::StringSink sink{&output};
  ::protoscribe::writer::ProtoWriter writer{&sink};
  if constexpr (std::is_void_v<decltype(node.Emit(&writer))>) {
    node.Emit(&writer);
  } else {
    absl::Status const status = node.Emit(&writer);
    if (!status.ok()) {
      return status;
    }
  }
  writer.Flush();
  return output;
}

}  // namespace testing

// Macros for testing the results of functions that return absl::Status or absl::StatusOr<T> (for
// any type T).
#define EXPECT_OK(expression) EXPECT_THAT((expression), ::absl_testing::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT((expression), ::absl_testing::IsOk())

#endif  // __PROTOSCRIBE_COMMON_TESTING_H__
