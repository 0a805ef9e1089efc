#ifndef __PROTOSCRIBE_WRITER_LINE_WRAPPER_H__
#define __PROTOSCRIBE_WRITER_LINE_WRAPPER_H__

#include <cstddef>
#include <string>
#include <string_view>

#include "writer/sink.h"

namespace protoscribe {
namespace writer {

// Column-aware text sink that breaks overlong lines at soft break points.
//
// Literal text passed to `Append` is never split. The only places where a line may be broken are
// the "wrapping spaces" requested with `WrappingSpace`: each of them renders as a single space if
// the text that follows it fits in the column limit, or as a newline followed by the continuation
// indentation and prefix otherwise. Newlines contained in appended text are passed through
// untouched and reset the column count.
//
// To decide whether a wrapping space turns into a line break the wrapper must see the text that
// follows it, so that text is buffered until the next wrapping space, the next newline, or an
// explicit `Flush`.
class LineWrapper {
 public:
  explicit LineWrapper(Sink* const sink, std::string_view const indent_unit,
                       size_t const column_limit)
      : sink_(sink), indent_unit_(indent_unit), column_limit_(column_limit) {}

  LineWrapper(LineWrapper&&) noexcept = default;
  LineWrapper& operator=(LineWrapper&&) noexcept = default;

  // Emits `text`, possibly turning the pending wrapping space (if any) into a line break.
  void Append(std::string_view text);

  // Emits a space or, if the following text doesn't fit, a newline followed by `indent_level`
  // repetitions of the indent unit and the `continuation_prefix`.
  void WrappingSpace(size_t indent_level, std::string_view continuation_prefix = "");

  // Writes out any pending space and buffered text.
  void Flush();

 private:
  enum class PendingBreak { kNone, kSpace, kWrap };

  LineWrapper(LineWrapper const&) = delete;
  LineWrapper& operator=(LineWrapper const&) = delete;

  void FlushPending(PendingBreak how);

  Sink* sink_;
  std::string indent_unit_;
  size_t column_limit_;

  // Text written after the pending wrapping space and not yet sent to the sink.
  std::string buffer_;

  size_t column_ = 0;

  PendingBreak pending_ = PendingBreak::kNone;
  size_t pending_indent_level_ = 0;
  std::string pending_prefix_;
};

}  // namespace writer
}  // namespace protoscribe

#endif  // __PROTOSCRIBE_WRITER_LINE_WRAPPER_H__
