#include "schema/import.h"

#include "common/testing.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::absl_testing::IsOkAndHolds;
using ::protoscribe::ImportSpec;
using ::testing::RenderToString;

TEST(ImportSpecTest, Plain) {
  ImportSpec const import{"foo/bar.proto"};
  EXPECT_EQ(import.modifier(), ImportSpec::Modifier::kNone);
  EXPECT_EQ(import.path(), "foo/bar.proto");
  EXPECT_THAT(RenderToString(import), IsOkAndHolds("import \"foo/bar.proto\";\n"));
}

TEST(ImportSpecTest, Public) {
  ImportSpec const import{ImportSpec::Modifier::kPublic, "foo/bar.proto"};
  EXPECT_THAT(RenderToString(import), IsOkAndHolds("import public \"foo/bar.proto\";\n"));
}

TEST(ImportSpecTest, Weak) {
  ImportSpec const import{ImportSpec::Modifier::kWeak, "foo/bar.proto"};
  EXPECT_THAT(RenderToString(import), IsOkAndHolds("import weak \"foo/bar.proto\";\n"));
}

TEST(ImportSpecTest, Equality) {
  EXPECT_EQ(ImportSpec("a.proto"), ImportSpec("a.proto"));
  EXPECT_EQ(ImportSpec("a.proto"), ImportSpec(ImportSpec::Modifier::kNone, "a.proto"));
  EXPECT_NE(ImportSpec("a.proto"), ImportSpec("b.proto"));
  EXPECT_NE(ImportSpec("a.proto"), ImportSpec(ImportSpec::Modifier::kPublic, "a.proto"));
}

TEST(ImportSpecDeathTest, NotAProtoFile) {
  EXPECT_DEATH(ImportSpec("foo/bar.txt"), "path must be a file ending with .proto");
}

TEST(ImportSpecDeathTest, EmptyPath) {
  EXPECT_DEATH(ImportSpec(""), "path must be a file ending with .proto");
}

}  // namespace
