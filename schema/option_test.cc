#include "schema/option.h"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "common/testing.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "schema/field_type.h"
#include "schema/field_value.h"
#include "writer/proto_writer.h"
#include "writer/sink.h"

namespace {

using ::absl_testing::IsOkAndHolds;
using ::protoscribe::EmitFieldOptions;
using ::protoscribe::EmitOptions;
using ::protoscribe::FieldType;
using ::protoscribe::FieldValue;
using ::protoscribe::IsWellKnownOptionName;
using ::protoscribe::OptionSpec;
using ::protoscribe::OptionType;
using ::protoscribe::OptionTypeMessageName;
using ::protoscribe::writer::ProtoWriter;
using ::protoscribe::writer::StringSink;
using ::testing::RenderToString;

std::string RenderFieldOptions(std::vector<OptionSpec> const& options) {
  std::string output;
  StringSink sink{&output};
  ProtoWriter writer{&sink};
  EmitFieldOptions(options, &writer);
  writer.Flush();
  return output;
}

TEST(OptionTypeTest, MessageNames) {
  EXPECT_EQ(OptionTypeMessageName(OptionType::kFile), "google.protobuf.FileOptions");
  EXPECT_EQ(OptionTypeMessageName(OptionType::kEnumValue), "google.protobuf.EnumValueOptions");
  EXPECT_EQ(OptionTypeMessageName(OptionType::kMethod), "google.protobuf.MethodOptions");
}

TEST(OptionTypeTest, WellKnownNames) {
  EXPECT_TRUE(IsWellKnownOptionName(OptionType::kFile, "java_package"));
  EXPECT_TRUE(IsWellKnownOptionName(OptionType::kFile, "go_package"));
  EXPECT_TRUE(IsWellKnownOptionName(OptionType::kMessage, "deprecated"));
  EXPECT_TRUE(IsWellKnownOptionName(OptionType::kField, "packed"));
  EXPECT_TRUE(IsWellKnownOptionName(OptionType::kEnum, "allow_alias"));
  EXPECT_TRUE(IsWellKnownOptionName(OptionType::kMethod, "idempotency_level"));
  EXPECT_FALSE(IsWellKnownOptionName(OptionType::kMessage, "java_package"));
  EXPECT_FALSE(IsWellKnownOptionName(OptionType::kField, "allow_alias"));
  EXPECT_FALSE(IsWellKnownOptionName(OptionType::kOneof, "deprecated"));
  EXPECT_FALSE(IsWellKnownOptionName(OptionType::kFile, "foo"));
}

TEST(OptionSpecTest, Int32Statement) {
  auto const option = OptionSpec::MessageOption("foo")
                          .SetOptionComment({"comment"})
                          .SetValue(FieldType::kInt32, std::numeric_limits<int32_t>::max())
                          .Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("// comment\noption (foo) = 2147483647;\n"));
}

TEST(OptionSpecTest, Int32Inline) {
  auto const option = OptionSpec::FieldOption("foo")
                          .SetValue(FieldType::kInt32, std::numeric_limits<int32_t>::max())
                          .Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("(foo) = 2147483647"));
}

TEST(OptionSpecTest, Int64Statement) {
  auto const option = OptionSpec::MessageOption("foo")
                          .SetValue(FieldType::kInt64, std::numeric_limits<int64_t>::max())
                          .Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("option (foo) = 9223372036854775807;\n"));
}

TEST(OptionSpecTest, DoubleInline) {
  auto const option = OptionSpec::FieldOption("foo").SetValue(FieldType::kDouble, 2.5).Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("(foo) = 2.5"));
}

TEST(OptionSpecTest, EnumStatement) {
  auto const option = OptionSpec::MessageOption("foo")
                          .SetOptionComment({"comment"})
                          .SetValue(FieldType::kEnum, "FOO")
                          .Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("// comment\noption (foo) = FOO;\n"));
}

TEST(OptionSpecTest, EnumInline) {
  auto const option = OptionSpec::FieldOption("foo").SetValue(FieldType::kEnum, "FOO").Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("(foo) = FOO"));
}

TEST(OptionSpecTest, StringStatement) {
  auto const option =
      OptionSpec::MessageOption("foo").SetValue(FieldType::kString, "hello").Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("option (foo) = \"hello\";\n"));
}

TEST(OptionSpecTest, StringInline) {
  auto const option = OptionSpec::FieldOption("foo").SetValue(FieldType::kString, "hello").Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("(foo) = \"hello\""));
}

TEST(OptionSpecTest, BoolInline) {
  auto const option = OptionSpec::FieldOption("foo").SetValue(FieldType::kBool, true).Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("(foo) = true"));
}

TEST(OptionSpecTest, WellKnownFileOption) {
  auto const option =
      OptionSpec::FileOption("java_package").SetValue(FieldType::kString, "com.example").Build();
  EXPECT_EQ(option.FormattedName(), "java_package");
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("option java_package = \"com.example\";\n"));
}

TEST(OptionSpecTest, WellKnownFieldOption) {
  auto const option =
      OptionSpec::FieldOption("deprecated").SetValue(FieldType::kBool, true).Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("deprecated = true"));
}

TEST(OptionSpecTest, WellKnownNameOfAnotherCategoryIsCustom) {
  auto const option =
      OptionSpec::MessageOption("java_package").SetValue(FieldType::kString, "x").Build();
  EXPECT_EQ(option.FormattedName(), "(java_package)");
}

TEST(OptionSpecTest, AlreadyParenthesizedName) {
  auto const option =
      OptionSpec::ServiceOption("(foo.bar).baz").SetValue(FieldType::kInt32, 1).Build();
  EXPECT_EQ(option.FormattedName(), "(foo.bar).baz");
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("option (foo.bar).baz = 1;\n"));
}

TEST(OptionSpecTest, MessageValueStatement) {
  auto const option = OptionSpec::MessageOption("foo")
                          .SetValue(FieldType::kMessage,
                                    std::vector<FieldValue>{
                                        FieldValue("a", FieldType::kInt32, 1),
                                        FieldValue("b", FieldType::kString, "x"),
                                    })
                          .Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("option (foo) = {\n"
                                                   "  a: 1\n"
                                                   "  b: \"x\"\n"
                                                   "};\n"));
}

TEST(OptionSpecTest, MessageValueInline) {
  auto const option = OptionSpec::FieldOption("foo")
                          .SetValue(FieldType::kMessage,
                                    std::vector<FieldValue>{
                                        FieldValue("a", FieldType::kInt32, 1),
                                        FieldValue("b", FieldType::kBool, false),
                                    })
                          .Build();
  EXPECT_THAT(RenderToString(option), IsOkAndHolds("(foo) = { a: 1 b: false }"));
}

TEST(OptionSpecTest, MultiLineComment) {
  auto const option = OptionSpec::EnumOption("allow_alias")
                          .SetOptionComment({"lorem", "ipsum"})
                          .SetValue(FieldType::kBool, true)
                          .Build();
  EXPECT_THAT(RenderToString(option),
              IsOkAndHolds("// lorem\n// ipsum\noption allow_alias = true;\n"));
}

TEST(OptionSpecTest, Accessors) {
  auto const option = OptionSpec::EnumValueOption("foo").SetValue(FieldType::kBool, true).Build();
  EXPECT_EQ(option.type(), OptionType::kEnumValue);
  EXPECT_EQ(option.name(), "foo");
  EXPECT_TRUE(option.is_inline());
  EXPECT_FALSE(OptionSpec::OneofOption("foo").SetValue(FieldType::kBool, true).Build().is_inline());
}

TEST(OptionSpecTest, NoFieldOptions) { EXPECT_EQ(RenderFieldOptions({}), ""); }

TEST(OptionSpecTest, OneFieldOption) {
  EXPECT_EQ(RenderFieldOptions({
                OptionSpec::FieldOption("packed").SetValue(FieldType::kBool, true).Build(),
            }),
            " [packed = true]");
}

TEST(OptionSpecTest, ManyFieldOptions) {
  EXPECT_EQ(RenderFieldOptions({
                OptionSpec::FieldOption("packed").SetValue(FieldType::kBool, true).Build(),
                OptionSpec::FieldOption("foo").SetValue(FieldType::kInt32, 42).Build(),
            }),
            " [packed = true, (foo) = 42]");
}

TEST(OptionSpecTest, LongFieldOptionListIsWrapped) {
  std::string const long_value(50, 'x');
  EXPECT_EQ(RenderFieldOptions({
                OptionSpec::FieldOption("first").SetValue(FieldType::kString, long_value).Build(),
                OptionSpec::FieldOption("second").SetValue(FieldType::kString, long_value).Build(),
            }),
            absl::StrCat(" [(first) = \"", long_value, "\",\n    (second) = \"", long_value,
                         "\"]"));
}

TEST(OptionSpecTest, StatementOptions) {
  std::string output;
  StringSink sink{&output};
  ProtoWriter writer{&sink};
  EmitOptions(
      std::vector<OptionSpec>{
          OptionSpec::FileOption("java_multiple_files").SetValue(FieldType::kBool, true).Build(),
          OptionSpec::FileOption("optimize_for").SetValue(FieldType::kEnum, "SPEED").Build(),
      },
      &writer);
  writer.Flush();
  EXPECT_EQ(output, "option java_multiple_files = true;\noption optimize_for = SPEED;\n");
}

TEST(OptionSpecDeathTest, CommentOnFieldOption) {
  EXPECT_DEATH(OptionSpec::FieldOption("foo").SetOptionComment({"comment"}),
               "comments aren't available for field options");
}

TEST(OptionSpecDeathTest, CommentOnEnumValueOption) {
  EXPECT_DEATH(OptionSpec::EnumValueOption("foo").SetOptionComment({"comment"}),
               "comments aren't available for field options");
}

TEST(OptionSpecDeathTest, MissingValue) {
  EXPECT_DEATH(OptionSpec::MessageOption("foo").Build(), "option 'foo' has no value");
}

TEST(OptionSpecDeathTest, MismatchedValueType) {
  EXPECT_DEATH(OptionSpec::MessageOption("foo").SetValue(FieldType::kString, 1),
               "'string' invalid type for an int value");
}

TEST(OptionSpecDeathTest, MessageValueForScalarType) {
  EXPECT_DEATH(OptionSpec::MessageOption("foo").SetValue(FieldType::kInt32,
                                                         std::vector<FieldValue>{}),
               "'int32' invalid type for a message value");
}

}  // namespace
