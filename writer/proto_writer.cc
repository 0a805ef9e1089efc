#include "writer/proto_writer.h"

#include <memory>
#include <string>
#include <string_view>

#include "absl/log/check.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "absl/types/span.h"
#include "writer/sink.h"

namespace protoscribe {
namespace writer {

namespace {

std::string_view constexpr kCommentPrefix = "// ";

}  // namespace

ProtoWriter ProtoWriter::Discarding(Options const& options) {
  return ProtoWriter(std::make_unique<DiscardSink>(), options);
}

void ProtoWriter::Indent() {
  if (++indentation_level_ > indentation_strings_.size()) {
    std::string indentation;
    for (size_t i = 0; i < IndentUnits(); ++i) {
      indentation += options_.indent_unit;
    }
    indentation_strings_.emplace_back(std::move(indentation));
  }
}

void ProtoWriter::Dedent() {
  CHECK_GT(indentation_level_, 0) << "cannot unindent below zero";
  --indentation_level_;
}

void ProtoWriter::EmitComment(absl::Span<std::string const> const lines) {
  for (auto const& line : lines) {
    // Force the comment prefix even if we're not at the beginning of a line.
    new_line_ = true;
    comment_ = true;
    EmitText(line);
    EmitText("\n");
    comment_ = false;
  }
}

void ProtoWriter::EmitWrappingSpace() {
  out_.WrappingSpace(IndentUnits() + 2 * options_.indent_width,
                     comment_ ? kCommentPrefix : std::string_view());
}

void ProtoWriter::EmitText(std::string_view const text) {
  bool first = true;
  for (std::string_view line : absl::StrSplit(text, '\n')) {
    if (comment_) {
      line = absl::StripTrailingAsciiWhitespace(line);
    }
    if (!first) {
      // Blank comment lines still need the marker to keep the comment contiguous.
      if (comment_ && new_line_) {
        EmitIndentation();
        out_.Append("//");
      }
      out_.Append("\n");
      new_line_ = true;
    }
    first = false;
    if (line.empty()) {
      continue;
    }
    if (new_line_) {
      EmitIndentation();
      if (comment_) {
        out_.Append(kCommentPrefix);
      }
    }
    if (comment_) {
      EmitCommentWords(line);
    } else {
      out_.Append(line);
    }
    new_line_ = false;
  }
}

void ProtoWriter::EmitCommentWords(std::string_view const line) {
  bool first = true;
  for (std::string_view const word : absl::StrSplit(line, ' ')) {
    if (!first) {
      out_.WrappingSpace(IndentUnits(), kCommentPrefix);
    }
    first = false;
    out_.Append(word);
  }
}

void ProtoWriter::EmitIndentation() {
  if (indentation_level_ > 0) {
    out_.Append(indentation_strings_[indentation_level_ - 1]);
  }
}

}  // namespace writer
}  // namespace protoscribe
