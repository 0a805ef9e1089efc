#ifndef __PROTOSCRIBE_WRITER_PROTO_WRITER_H__
#define __PROTOSCRIBE_WRITER_PROTO_WRITER_H__

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "writer/line_wrapper.h"
#include "writer/sink.h"

namespace protoscribe {
namespace writer {

// Indentation- and comment-aware text emitter used by all the schema nodes to render `.proto`
// source.
//
// `Emit` splits its text on newlines: every line after the first one is preceded by an actual
// newline and, unless it's empty, by the current indentation. Empty lines are never indented.
//
// In comment mode (see `EmitComment`) every line is prefixed with `// `, blank comment lines are
// rendered as a bare `//`, and overlong comment lines are wrapped at word boundaries with the
// continuation lines carrying the same prefix.
class ProtoWriter {
 public:
  struct Options {
    // The string repeated to build indentation.
    std::string indent_unit = " ";

    // How many `indent_unit`s make up one indentation step.
    size_t indent_width = 2;

    // Column limit for the line wrapper.
    size_t line_width = 80;
  };

  class IndentedScope final {
   public:
    explicit IndentedScope(ProtoWriter* const parent) : parent_(parent) { parent_->Indent(); }
    ~IndentedScope() { parent_->Dedent(); }

   private:
    IndentedScope(IndentedScope const&) = delete;
    IndentedScope& operator=(IndentedScope const&) = delete;
    IndentedScope(IndentedScope&&) = delete;
    IndentedScope& operator=(IndentedScope&&) = delete;

    ProtoWriter* const parent_;
  };

  // Returns a writer that performs all the bookkeeping of a regular one but drops the output.
  static ProtoWriter Discarding() { return Discarding(/*options=*/{}); }
  static ProtoWriter Discarding(Options const& options);

  explicit ProtoWriter(Sink* const sink, Options const& options)
      : options_(options), out_(sink, options_.indent_unit, options_.line_width) {}

  explicit ProtoWriter(Sink* const sink) : ProtoWriter(sink, /*options=*/{}) {}

  ~ProtoWriter() = default;

  ProtoWriter(ProtoWriter&&) noexcept = default;
  ProtoWriter& operator=(ProtoWriter&&) noexcept = default;

  void Indent();

  // Check-fails if the indentation level is already zero.
  void Dedent();

  template <typename... Args>
  void Emit(Args&&... args) {
    EmitText(absl::StrCat(std::forward<Args>(args)...));
  }

  // Emits each line as a `//` comment on its own line, at the current indentation.
  void EmitComment(absl::Span<std::string const> lines);

  // Emits a space that becomes a line break if the text that follows doesn't fit in the line
  // width. Continuation lines are indented by two extra steps.
  void EmitWrappingSpace();

  void Flush() { out_.Flush(); }

 private:
  explicit ProtoWriter(std::unique_ptr<Sink> owned_sink, Options const& options)
      : options_(options),
        owned_sink_(std::move(owned_sink)),
        out_(owned_sink_.get(), options_.indent_unit, options_.line_width) {}

  ProtoWriter(ProtoWriter const&) = delete;
  ProtoWriter& operator=(ProtoWriter const&) = delete;

  // Number of indent units corresponding to the current indentation level.
  size_t IndentUnits() const { return indentation_level_ * options_.indent_width; }

  void EmitText(std::string_view text);
  void EmitCommentWords(std::string_view line);
  void EmitIndentation();

  Options options_;
  std::unique_ptr<Sink> owned_sink_;
  LineWrapper out_;

  size_t indentation_level_ = 0;
  std::vector<std::string> indentation_strings_;

  bool new_line_ = true;
  bool comment_ = false;
};

}  // namespace writer
}  // namespace protoscribe

#endif  // __PROTOSCRIBE_WRITER_PROTO_WRITER_H__
