#include "writer/line_wrapper.h"

#include <string>

#include "gtest/gtest.h"
#include "writer/sink.h"

namespace {

using ::protoscribe::writer::LineWrapper;
using ::protoscribe::writer::StringSink;

class LineWrapperTest : public ::testing::Test {
 protected:
  std::string output_;
  StringSink sink_{&output_};
  LineWrapper wrapper_{&sink_, /*indent_unit=*/" ", /*column_limit=*/10};
};

TEST_F(LineWrapperTest, Empty) {
  wrapper_.Flush();
  EXPECT_EQ(output_, "");
}

TEST_F(LineWrapperTest, PassThrough) {
  wrapper_.Append("lorem");
  EXPECT_EQ(output_, "lorem");
}

TEST_F(LineWrapperTest, LiteralTextIsNeverBroken) {
  wrapper_.Append("lorem ipsum dolor amet");
  EXPECT_EQ(output_, "lorem ipsum dolor amet");
}

TEST_F(LineWrapperTest, NewlineResetsColumn) {
  wrapper_.Append("lorem");
  wrapper_.Append("ipsum\nab");
  EXPECT_EQ(output_, "loremipsum\nab");
}

TEST_F(LineWrapperTest, WrappingSpaceThatFits) {
  wrapper_.Append("ab");
  wrapper_.WrappingSpace(2);
  wrapper_.Append("cd");
  wrapper_.Flush();
  EXPECT_EQ(output_, "ab cd");
}

TEST_F(LineWrapperTest, ExactFit) {
  wrapper_.Append("abcd");
  wrapper_.WrappingSpace(2);
  wrapper_.Append("efghi");
  wrapper_.Flush();
  EXPECT_EQ(output_, "abcd efghi");
}

TEST_F(LineWrapperTest, TextAfterWrappingSpaceIsBuffered) {
  wrapper_.Append("ab");
  wrapper_.WrappingSpace(2);
  wrapper_.Append("cd");
  EXPECT_EQ(output_, "ab");
  wrapper_.Flush();
  EXPECT_EQ(output_, "ab cd");
}

TEST_F(LineWrapperTest, Wrap) {
  wrapper_.Append("aaaaaaa");
  wrapper_.WrappingSpace(2);
  wrapper_.Append("bbbb");
  wrapper_.Flush();
  EXPECT_EQ(output_, "aaaaaaa\n  bbbb");
}

TEST_F(LineWrapperTest, WrapWithPrefix) {
  wrapper_.Append("aaaaaaa");
  wrapper_.WrappingSpace(1, "# ");
  wrapper_.Append("bbbb");
  wrapper_.Flush();
  EXPECT_EQ(output_, "aaaaaaa\n # bbbb");
}

TEST_F(LineWrapperTest, WrapWithCustomIndentUnit) {
  LineWrapper wrapper{&sink_, /*indent_unit=*/"\t", /*column_limit=*/4};
  wrapper.Append("aaa");
  wrapper.WrappingSpace(2);
  wrapper.Append("bb");
  wrapper.Flush();
  EXPECT_EQ(output_, "aaa\n\t\tbb");
}

TEST_F(LineWrapperTest, SeveralWraps) {
  wrapper_.Append("aaaa");
  wrapper_.WrappingSpace(0);
  wrapper_.Append("bbbb");
  wrapper_.WrappingSpace(0);
  wrapper_.Append("cccc");
  wrapper_.WrappingSpace(0);
  wrapper_.Append("dddd");
  wrapper_.Flush();
  EXPECT_EQ(output_, "aaaa bbbb\ncccc dddd");
}

TEST_F(LineWrapperTest, EmptyTextDoesNotForceWrap) {
  wrapper_.Append("aaaaaaaaaa");
  wrapper_.WrappingSpace(0);
  wrapper_.Append("");
  EXPECT_EQ(output_, "aaaaaaaaaa");
  wrapper_.Append("b");
  wrapper_.Flush();
  EXPECT_EQ(output_, "aaaaaaaaaa\nb");
}

TEST_F(LineWrapperTest, NewlineFlushesPendingSpace) {
  wrapper_.Append("a");
  wrapper_.WrappingSpace(2);
  wrapper_.Append("b\n");
  EXPECT_EQ(output_, "a b\n");
}

TEST_F(LineWrapperTest, NewlineAfterOverflow) {
  wrapper_.Append("aaaaaaa");
  wrapper_.WrappingSpace(0);
  wrapper_.Append("bbbbbbbb\n");
  EXPECT_EQ(output_, "aaaaaaa\nbbbbbbbb\n");
}

TEST_F(LineWrapperTest, ConsecutiveWrappingSpaces) {
  wrapper_.Append("a");
  wrapper_.WrappingSpace(0);
  wrapper_.WrappingSpace(0);
  wrapper_.Append("b");
  wrapper_.Flush();
  EXPECT_EQ(output_, "a  b");
}

TEST_F(LineWrapperTest, OverlongWordStaysOnItsOwnLine) {
  wrapper_.Append("a");
  wrapper_.WrappingSpace(0);
  wrapper_.Append("bbbbbbbbbbbbbbb");
  wrapper_.Flush();
  EXPECT_EQ(output_, "a\nbbbbbbbbbbbbbbb");
}

}  // namespace
