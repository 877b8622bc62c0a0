// Copyright 2021 gRPC authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_KEYS_H
#define AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_KEYS_H

#include <authz/support/json.h>

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/functional/any_invocable.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "src/core/security/authorization/attribute_value.h"

namespace authz_core {

// The parts of an incoming request that condition keys are derived from.
class RequestAttributes {
 public:
  // Header names are case-insensitive.  Setting a header again replaces it.
  void SetHeader(absl::string_view name, absl::string_view value);
  std::optional<absl::string_view> GetHeader(absl::string_view name) const;

  // Peer address in "host:port" form, e.g. "10.1.2.3:5555" or "[::1]:80".
  const std::string& remote_address() const { return remote_address_; }
  void set_remote_address(std::string address) {
    remote_address_ = std::move(address);
  }

 private:
  absl::flat_hash_map<std::string, std::string> headers_;
  std::string remote_address_;
};

// Derives the value of one named condition key from a request.
class ConditionKeyParser {
 public:
  virtual ~ConditionKeyParser() = default;

  // The key the value is published under, e.g. "inf:SourceIP".
  virtual absl::string_view name() const = 0;

  // Returns a scalar, or null if the request carries no value for the key.
  virtual Json Parse(const RequestAttributes& request) const = 0;
};

// inf:SourceIP.  The first non-empty of the x-client-ip, X-Real-IP and
// X-Forwarded-For headers, otherwise the host part of the peer address.
// The IPv6 loopback is reported as 127.0.0.1.
class SourceIpConditionKey final : public ConditionKeyParser {
 public:
  static constexpr absl::string_view kName = "inf:SourceIP";

  absl::string_view name() const override { return kName; }
  Json Parse(const RequestAttributes& request) const override;
};

// inf:CurrentTime.  The current UTC time in RFC3339 form with second
// precision, e.g. "2024-01-10T00:00:00Z".
class CurrentTimeConditionKey final : public ConditionKeyParser {
 public:
  static constexpr absl::string_view kName = "inf:CurrentTime";

  using Clock = absl::AnyInvocable<absl::Time() const>;

  CurrentTimeConditionKey();
  explicit CurrentTimeConditionKey(Clock clock) : clock_(std::move(clock)) {}

  absl::string_view name() const override { return kName; }
  Json Parse(const RequestAttributes& request) const override;

 private:
  Clock clock_;
};

// iam:ServiceName.  The X-Service-Name header.
class ServiceNameConditionKey final : public ConditionKeyParser {
 public:
  static constexpr absl::string_view kName = "iam:ServiceName";
  static constexpr absl::string_view kHeader = "X-Service-Name";

  absl::string_view name() const override { return kName; }
  Json Parse(const RequestAttributes& request) const override;
};

class ConditionKeyRegistry final {
 public:
  /// Methods used to create and populate the ConditionKeyRegistry.
  /// NOT THREAD SAFE -- to be used only while assembling a registry.
  class Builder final {
   public:
    /// Registers a parser under its name().  Names must be unique.
    void RegisterConditionKey(std::unique_ptr<ConditionKeyParser> parser);

    ConditionKeyRegistry Build();

   private:
    std::map<absl::string_view, std::unique_ptr<ConditionKeyParser>> parsers_;
  };

  /// Returns the parser registered as \a name, or nullptr.
  const ConditionKeyParser* GetConditionKey(absl::string_view name) const;

  /// Runs every registered parser against \a request.  Keys whose parser
  /// yields null or a non-scalar are left out.
  ConditionContext BuildConditionContext(
      const RequestAttributes& request) const;

  size_t size() const { return parsers_.size(); }

 private:
  std::map<absl::string_view, std::unique_ptr<ConditionKeyParser>> parsers_;
};

// Registers inf:SourceIP, inf:CurrentTime and iam:ServiceName.
void RegisterDefaultConditionKeys(ConditionKeyRegistry::Builder* builder);

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_CONDITION_KEYS_H
