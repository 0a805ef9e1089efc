#ifndef __PROTOSCRIBE_WRITER_SINK_H__
#define __PROTOSCRIBE_WRITER_SINK_H__

#include <string>
#include <string_view>

#include "absl/strings/cord.h"

namespace protoscribe {
namespace writer {

// Append-only destination for rendered text. The sink is owned by the caller and must outlive any
// writer that refers to it.
class Sink {
 public:
  explicit Sink() = default;
  virtual ~Sink() = default;

  virtual void Append(std::string_view text) = 0;

 private:
  Sink(Sink const&) = delete;
  Sink& operator=(Sink const&) = delete;
  Sink(Sink&&) = delete;
  Sink& operator=(Sink&&) = delete;
};

// Appends to a caller-owned `std::string`.
class StringSink final : public Sink {
 public:
  explicit StringSink(std::string* const target) : target_(target) {}

  void Append(std::string_view const text) override { target_->append(text); }

 private:
  std::string* const target_;
};

// Appends to a caller-owned `absl::Cord`.
class CordSink final : public Sink {
 public:
  explicit CordSink(absl::Cord* const target) : target_(target) {}

  void Append(std::string_view const text) override { target_->Append(text); }

 private:
  absl::Cord* const target_;
};

// Drops everything. Useful when only the validation side effects of a render are needed.
class DiscardSink final : public Sink {
 public:
  void Append(std::string_view const /*text*/) override {}
};

}  // namespace writer
}  // namespace protoscribe

#endif  // __PROTOSCRIBE_WRITER_SINK_H__
