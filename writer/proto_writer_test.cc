#include "writer/proto_writer.h"

#include <string>
#include <vector>

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "gtest/gtest.h"
#include "writer/sink.h"

namespace {

using ::protoscribe::writer::CordSink;
using ::protoscribe::writer::ProtoWriter;
using ::protoscribe::writer::StringSink;

class ProtoWriterTest : public ::testing::Test {
 protected:
  std::string const& Finish() {
    writer_.Flush();
    return output_;
  }

  std::string output_;
  StringSink sink_{&output_};
  ProtoWriter writer_{&sink_};
};

TEST_F(ProtoWriterTest, Empty) { EXPECT_EQ(Finish(), ""); }

TEST_F(ProtoWriterTest, Emit) {
  writer_.Emit("lorem ipsum");
  EXPECT_EQ(Finish(), "lorem ipsum");
}

TEST_F(ProtoWriterTest, EmitMultiPart) {
  writer_.Emit("lorem ", 42, " ipsum\n");
  EXPECT_EQ(Finish(), "lorem 42 ipsum\n");
}

TEST_F(ProtoWriterTest, EmitTwoLines) {
  writer_.Emit("dolor amet\n");
  writer_.Emit("lorem ipsum\n");
  EXPECT_EQ(Finish(), "dolor amet\nlorem ipsum\n");
}

TEST_F(ProtoWriterTest, Indent) {
  writer_.Indent();
  writer_.Emit("lorem ipsum\n");
  EXPECT_EQ(Finish(), "  lorem ipsum\n");
}

TEST_F(ProtoWriterTest, IndentTwice) {
  writer_.Indent();
  writer_.Indent();
  writer_.Emit("lorem ipsum\n");
  EXPECT_EQ(Finish(), "    lorem ipsum\n");
}

TEST_F(ProtoWriterTest, Dedent) {
  writer_.Emit("lorem ipsum\n");
  writer_.Indent();
  writer_.Emit("dolor amet\n");
  writer_.Dedent();
  writer_.Emit("adipisci elit\n");
  EXPECT_EQ(Finish(), "lorem ipsum\n  dolor amet\nadipisci elit\n");
}

TEST_F(ProtoWriterTest, DedentTwice) {
  writer_.Emit("lorem\n");
  writer_.Indent();
  writer_.Emit("ipsum\n");
  writer_.Indent();
  writer_.Emit("dolor\n");
  writer_.Dedent();
  writer_.Emit("amet\n");
  writer_.Dedent();
  writer_.Emit("adipisci\n");
  EXPECT_EQ(Finish(), "lorem\n  ipsum\n    dolor\n  amet\nadipisci\n");
}

TEST_F(ProtoWriterTest, DedentBelowZero) {
  writer_.Indent();
  writer_.Dedent();
  EXPECT_DEATH(writer_.Dedent(), "cannot unindent below zero");
}

TEST_F(ProtoWriterTest, InternalNewlinesAreIndented) {
  writer_.Indent();
  writer_.Emit("lorem {\nipsum\n}\n");
  EXPECT_EQ(Finish(), "  lorem {\n  ipsum\n  }\n");
}

TEST_F(ProtoWriterTest, EmptyLineIsNotIndented) {
  writer_.Indent();
  writer_.Emit("lorem\n");
  writer_.Emit("\n");
  writer_.Emit("ipsum\n");
  EXPECT_EQ(Finish(), "  lorem\n\n  ipsum\n");
}

TEST_F(ProtoWriterTest, ContinuedLineIsNotIndentedAgain) {
  writer_.Indent();
  writer_.Emit("lorem");
  writer_.Emit(" ipsum");
  writer_.Emit(";\n");
  EXPECT_EQ(Finish(), "  lorem ipsum;\n");
}

TEST_F(ProtoWriterTest, IndentedScope) {
  writer_.Emit("lorem\n");
  {
    ProtoWriter::IndentedScope is{&writer_};
    writer_.Emit("ipsum\n");
  }
  writer_.Emit("dolor\n");
  EXPECT_EQ(Finish(), "lorem\n  ipsum\ndolor\n");
}

TEST_F(ProtoWriterTest, NestedIndentedScope) {
  writer_.Emit("lorem\n");
  {
    ProtoWriter::IndentedScope is{&writer_};
    writer_.Emit("ipsum\n");
    {
      ProtoWriter::IndentedScope is{&writer_};
      writer_.Emit("dolor\n");
    }
    writer_.Emit("amet\n");
  }
  writer_.Emit("adipisci\n");
  EXPECT_EQ(Finish(), "lorem\n  ipsum\n    dolor\n  amet\nadipisci\n");
}

TEST_F(ProtoWriterTest, OverrideIndentWidth) {
  ProtoWriter writer{&sink_, ProtoWriter::Options{.indent_width = 3}};
  writer.Emit("lorem\n");
  writer.Indent();
  writer.Emit("ipsum\n");
  writer.Indent();
  writer.Emit("dolor\n");
  writer.Dedent();
  writer.Emit("amet\n");
  writer.Dedent();
  writer.Emit("adipisci\n");
  EXPECT_EQ(output_, "lorem\n   ipsum\n      dolor\n   amet\nadipisci\n");
}

TEST_F(ProtoWriterTest, OverrideIndentUnit) {
  ProtoWriter writer{&sink_, ProtoWriter::Options{.indent_unit = "\t", .indent_width = 1}};
  writer.Indent();
  writer.Emit("lorem\n");
  writer.Indent();
  writer.Emit("ipsum\n");
  EXPECT_EQ(output_, "\tlorem\n\t\tipsum\n");
}

TEST_F(ProtoWriterTest, Comment) {
  writer_.EmitComment(std::vector<std::string>{"lorem ipsum"});
  EXPECT_EQ(Finish(), "// lorem ipsum\n");
}

TEST_F(ProtoWriterTest, MultiLineComment) {
  writer_.EmitComment(std::vector<std::string>{"lorem", "ipsum", "dolor"});
  EXPECT_EQ(Finish(), "// lorem\n// ipsum\n// dolor\n");
}

TEST_F(ProtoWriterTest, IndentedComment) {
  writer_.Indent();
  writer_.EmitComment(std::vector<std::string>{"lorem", "ipsum"});
  writer_.Emit("dolor;\n");
  EXPECT_EQ(Finish(), "  // lorem\n  // ipsum\n  dolor;\n");
}

TEST_F(ProtoWriterTest, BlankCommentLine) {
  writer_.Indent();
  writer_.EmitComment(std::vector<std::string>{"lorem", "", "ipsum"});
  EXPECT_EQ(Finish(), "  // lorem\n  //\n  // ipsum\n");
}

TEST_F(ProtoWriterTest, CommentLineWithEmbeddedNewline) {
  writer_.EmitComment(std::vector<std::string>{"lorem\nipsum"});
  EXPECT_EQ(Finish(), "// lorem\n// ipsum\n");
}

TEST_F(ProtoWriterTest, CommentPreservesInnerSpaces) {
  writer_.EmitComment(std::vector<std::string>{"  lorem  ipsum"});
  EXPECT_EQ(Finish(), "//   lorem  ipsum\n");
}

TEST_F(ProtoWriterTest, CommentTrailingSpacesAreDropped) {
  writer_.EmitComment(std::vector<std::string>{"lorem  ", "   ", "ipsum \ndolor"});
  EXPECT_EQ(Finish(), "// lorem\n//\n// ipsum\n// dolor\n");
}

TEST_F(ProtoWriterTest, CommentLineEndingAtColumnLimit) {
  writer_.EmitComment(std::vector<std::string>{std::string(77, 'a') + " ", "next"});
  EXPECT_EQ(Finish(), absl::StrCat("// ", std::string(77, 'a'), "\n// next\n"));
}

TEST_F(ProtoWriterTest, CommentModeEndsAfterComment) {
  writer_.EmitComment(std::vector<std::string>{"lorem"});
  writer_.Emit("ipsum\n\ndolor\n");
  EXPECT_EQ(Finish(), "// lorem\nipsum\n\ndolor\n");
}

TEST_F(ProtoWriterTest, LongCommentIsWrapped) {
  writer_.EmitComment(std::vector<std::string>{
      "abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi "
      "abcdefghi abcdefghi"});
  EXPECT_EQ(Finish(),
            "// abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi\n"
            "// abcdefghi abcdefghi abcdefghi\n");
}

TEST_F(ProtoWriterTest, LongIndentedCommentIsWrapped) {
  writer_.Indent();
  writer_.EmitComment(std::vector<std::string>{
      "abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi"});
  EXPECT_EQ(Finish(),
            "  // abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi abcdefghi\n"
            "  // abcdefghi\n");
}

TEST_F(ProtoWriterTest, WrappingSpaceThatFits) {
  writer_.Indent();
  writer_.Emit("lorem [a = 1,");
  writer_.EmitWrappingSpace();
  writer_.Emit("b = 2];\n");
  EXPECT_EQ(Finish(), "  lorem [a = 1, b = 2];\n");
}

TEST_F(ProtoWriterTest, WrappingSpaceThatWraps) {
  writer_.Indent();
  writer_.Emit(std::string(60, 'x'), ",");
  writer_.EmitWrappingSpace();
  writer_.Emit(std::string(30, 'y'));
  writer_.Emit(";\n");
  EXPECT_EQ(Finish(),
            absl::StrCat("  ", std::string(60, 'x'), ",\n      ", std::string(30, 'y'), ";\n"));
}

TEST_F(ProtoWriterTest, CordSink) {
  absl::Cord cord;
  CordSink sink{&cord};
  ProtoWriter writer{&sink};
  writer.Emit("lorem\n");
  writer.Indent();
  writer.Emit("ipsum\n");
  EXPECT_EQ(std::string(cord), "lorem\n  ipsum\n");
}

TEST_F(ProtoWriterTest, Discarding) {
  ProtoWriter writer = ProtoWriter::Discarding();
  writer.Emit("lorem\n");
  writer.Indent();
  writer.EmitComment(std::vector<std::string>{"ipsum"});
  writer.Dedent();
  EXPECT_DEATH(writer.Dedent(), "cannot unindent below zero");
}

}  // namespace
