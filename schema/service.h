#ifndef __PROTOSCRIBE_SCHEMA_SERVICE_H__
#define __PROTOSCRIBE_SCHEMA_SERVICE_H__

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "schema/buildable.h"
#include "schema/option.h"
#include "usage/used_field_monitor.h"
#include "writer/proto_writer.h"

namespace protoscribe {

// An rpc method, e.g. `rpc Watch (Request) returns (stream Event);`. Methods have no field number
// and are checked by name only.
class RpcFieldSpec {
 public:
  class Builder {
   public:
    explicit Builder(std::string_view const name) : name_(name) {}

    Builder& SetFieldComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    Builder& SetRequestMessageName(std::string_view const message_name,
                                   bool const streaming = false) {
      request_.emplace(Part{.message_name = std::string(message_name), .streaming = streaming});
      return *this;
    }

    Builder& SetResponseMessageName(std::string_view const message_name,
                                    bool const streaming = false) {
      response_.emplace(Part{.message_name = std::string(message_name), .streaming = streaming});
      return *this;
    }

    // Check-fails on options that aren't method options.
    template <typename... Options>
    Builder& AddFieldOptions(Options&&... options) {
      internal::AppendBuiltChecked(&options_, &CheckOption, std::forward<Options>(options)...);
      return *this;
    }

    // Check-fails unless both the request and the response message were set.
    RpcFieldSpec Build() const;

   private:
    friend class RpcFieldSpec;

    struct Part {
      std::string message_name;
      bool streaming;
    };

    static void CheckOption(OptionSpec const& option) {
      CHECK(option.type() == OptionType::kMethod) << "option must be method type";
    }

    std::string name_;
    std::vector<std::string> comment_;
    std::optional<Part> request_;
    std::optional<Part> response_;
    std::vector<OptionSpec> options_;
  };

  RpcFieldSpec(RpcFieldSpec const&) = default;
  RpcFieldSpec& operator=(RpcFieldSpec const&) = default;
  RpcFieldSpec(RpcFieldSpec&&) noexcept = default;
  RpcFieldSpec& operator=(RpcFieldSpec&&) noexcept = default;

  std::string_view name() const { return name_; }

  usage::FieldIdentity field_identity() const {
    return usage::FieldIdentity{.name = name_, .number = std::nullopt};
  }

  void Emit(writer::ProtoWriter* writer) const;

 private:
  explicit RpcFieldSpec(Builder const& builder);

  std::string name_;
  std::vector<std::string> comment_;
  std::string request_;
  std::string response_;
  std::vector<OptionSpec> options_;
};

// A service declaration. Options come first, then the methods in declaration order. Method names
// must be unique within the service.
class ServiceSpec {
 public:
  class Builder {
   public:
    explicit Builder(std::string_view const name) : name_(name) {}

    Builder& SetServiceComment(std::vector<std::string> lines) {
      comment_ = std::move(lines);
      return *this;
    }

    template <typename... Rpcs>
    Builder& AddRpcFields(Rpcs&&... rpcs) {
      internal::AppendBuilt(&rpcs_, std::forward<Rpcs>(rpcs)...);
      return *this;
    }

    // Check-fails on options that aren't service options.
    template <typename... Options>
    Builder& AddServiceOptions(Options&&... options) {
      internal::AppendBuiltChecked(&options_, &CheckOption, std::forward<Options>(options)...);
      return *this;
    }

    ServiceSpec Build() const { return ServiceSpec(name_, comment_, rpcs_, options_); }

   private:
    static void CheckOption(OptionSpec const& option) {
      CHECK(option.type() == OptionType::kService) << "option must be service type";
    }

    std::string name_;
    std::vector<std::string> comment_;
    std::vector<RpcFieldSpec> rpcs_;
    std::vector<OptionSpec> options_;
  };

  ServiceSpec(ServiceSpec const&) = default;
  ServiceSpec& operator=(ServiceSpec const&) = default;
  ServiceSpec(ServiceSpec&&) noexcept = default;
  ServiceSpec& operator=(ServiceSpec&&) noexcept = default;

  std::string_view type_name() const { return name_; }

  absl::Status Emit(writer::ProtoWriter* writer) const;

 private:
  explicit ServiceSpec(std::string name, std::vector<std::string> comment,
                       std::vector<RpcFieldSpec> rpcs, std::vector<OptionSpec> options)
      : name_(std::move(name)),
        comment_(std::move(comment)),
        rpcs_(std::move(rpcs)),
        options_(std::move(options)) {}

  std::string name_;
  std::vector<std::string> comment_;
  std::vector<RpcFieldSpec> rpcs_;
  std::vector<OptionSpec> options_;

  usage::UsedFieldMonitor mutable used_fields_;
};

}  // namespace protoscribe

#endif  // __PROTOSCRIBE_SCHEMA_SERVICE_H__
