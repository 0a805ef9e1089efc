#include "writer/line_wrapper.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace protoscribe {
namespace writer {

void LineWrapper::Append(std::string_view const text) {
  if (text.empty()) {
    return;
  }
  size_t const first_newline = text.find('\n');
  if (pending_ != PendingBreak::kNone) {
    // Keep buffering as long as the current line stays within the limit. We'll decide how to
    // render the pending space later.
    if (first_newline == std::string_view::npos && column_ + text.size() <= column_limit_) {
      buffer_.append(text);
      column_ += text.size();
      return;
    }
    bool const wrap =
        first_newline == std::string_view::npos || column_ + first_newline > column_limit_;
    FlushPending(wrap ? PendingBreak::kWrap : pending_);
  }
  sink_->Append(text);
  size_t const last_newline = text.rfind('\n');
  if (last_newline != std::string_view::npos) {
    column_ = text.size() - last_newline - 1;
  } else {
    column_ += text.size();
  }
}

void LineWrapper::WrappingSpace(size_t const indent_level,
                                std::string_view const continuation_prefix) {
  if (pending_ != PendingBreak::kNone) {
    FlushPending(pending_);
  }
  // The space is deferred, but it's accounted for right away.
  ++column_;
  pending_ = PendingBreak::kSpace;
  pending_indent_level_ = indent_level;
  pending_prefix_ = std::string(continuation_prefix);
}

void LineWrapper::Flush() {
  if (pending_ != PendingBreak::kNone) {
    FlushPending(pending_);
  }
}

void LineWrapper::FlushPending(PendingBreak const how) {
  switch (how) {
    case PendingBreak::kWrap:
      sink_->Append("\n");
      for (size_t i = 0; i < pending_indent_level_; ++i) {
        sink_->Append(indent_unit_);
      }
      sink_->Append(pending_prefix_);
      column_ = pending_indent_level_ * indent_unit_.size() + pending_prefix_.size() +
                buffer_.size();
      break;
    case PendingBreak::kSpace:
      sink_->Append(" ");
      break;
    case PendingBreak::kNone:
      break;
  }
  sink_->Append(buffer_);
  buffer_.clear();
  pending_ = PendingBreak::kNone;
  pending_indent_level_ = 0;
  pending_prefix_.clear();
}

}  // namespace writer
}  // namespace protoscribe
