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

#include "src/core/security/authorization/condition_keys.h"

#include <utility>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/time/clock.h"
#include "src/core/debug/trace.h"

namespace authz_core {

namespace {

constexpr absl::string_view kClientIpHeader = "x-client-ip";
constexpr absl::string_view kRealIpHeader = "X-Real-IP";
constexpr absl::string_view kForwardedForHeader = "X-Forwarded-For";

// Returns the host part of "host:port" or "[host]:port", or an empty string
// if address is not in either form.
absl::string_view SplitHost(absl::string_view address) {
  if (!address.empty() && address[0] == '[') {
    size_t close = address.find(']');
    if (close == absl::string_view::npos || close + 1 >= address.size() ||
        address[close + 1] != ':') {
      return "";
    }
    return address.substr(1, close - 1);
  }
  size_t colon = address.rfind(':');
  if (colon == absl::string_view::npos) return "";
  absl::string_view host = address.substr(0, colon);
  // An unbracketed IPv6 literal is ambiguous.
  if (host.find(':') != absl::string_view::npos) return "";
  return host;
}

}  // namespace

//
// RequestAttributes
//

void RequestAttributes::SetHeader(absl::string_view name,
                                  absl::string_view value) {
  headers_[absl::AsciiStrToLower(name)] = std::string(value);
}

std::optional<absl::string_view> RequestAttributes::GetHeader(
    absl::string_view name) const {
  auto it = headers_.find(absl::AsciiStrToLower(name));
  if (it == headers_.end()) return std::nullopt;
  return it->second;
}

//
// Built-in condition keys
//

Json SourceIpConditionKey::Parse(const RequestAttributes& request) const {
  std::string ip;
  for (absl::string_view header :
       {kClientIpHeader, kRealIpHeader, kForwardedForHeader}) {
    std::optional<absl::string_view> value = request.GetHeader(header);
    if (value.has_value() && !value->empty()) {
      ip = std::string(*value);
      AUTHZ_TRACE_LOG(condition_keys, INFO)
          << kName << ": from header " << header << ": " << ip;
      break;
    }
  }
  if (ip.empty()) {
    ip = std::string(SplitHost(request.remote_address()));
    AUTHZ_TRACE_LOG(condition_keys, INFO)
        << kName << ": from peer " << request.remote_address() << ": " << ip;
  }
  if (ip == "::1") ip = "127.0.0.1";
  return Json::FromString(std::move(ip));
}

CurrentTimeConditionKey::CurrentTimeConditionKey()
    : clock_([]() { return absl::Now(); }) {}

Json CurrentTimeConditionKey::Parse(const RequestAttributes& /*request*/) const {
  return Json::FromString(
      absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", clock_(), absl::UTCTimeZone()));
}

Json ServiceNameConditionKey::Parse(const RequestAttributes& request) const {
  std::optional<absl::string_view> value = request.GetHeader(kHeader);
  return Json::FromString(std::string(value.value_or("")));
}

//
// ConditionKeyRegistry::Builder
//

void ConditionKeyRegistry::Builder::RegisterConditionKey(
    std::unique_ptr<ConditionKeyParser> parser) {
  VLOG(2) << "registering condition key \"" << parser->name() << "\"";
  CHECK(parsers_.find(parser->name()) == parsers_.end())
      << "duplicate condition key " << parser->name();
  parsers_.emplace(parser->name(), std::move(parser));
}

ConditionKeyRegistry ConditionKeyRegistry::Builder::Build() {
  ConditionKeyRegistry out;
  out.parsers_ = std::move(parsers_);
  return out;
}

//
// ConditionKeyRegistry
//

const ConditionKeyParser* ConditionKeyRegistry::GetConditionKey(
    absl::string_view name) const {
  auto it = parsers_.find(name);
  if (it == parsers_.end()) return nullptr;
  return it->second.get();
}

ConditionContext ConditionKeyRegistry::BuildConditionContext(
    const RequestAttributes& request) const {
  ConditionContext context;
  for (const auto& entry : parsers_) {
    std::optional<AttributeValue> value =
        AttributeValue::FromJson(entry.second->Parse(request));
    if (!value.has_value()) {
      AUTHZ_TRACE_LOG(condition_keys, INFO)
          << entry.first << ": no value for this request";
      continue;
    }
    context.emplace(std::string(entry.first), std::move(*value));
  }
  return context;
}

void RegisterDefaultConditionKeys(ConditionKeyRegistry::Builder* builder) {
  builder->RegisterConditionKey(std::make_unique<SourceIpConditionKey>());
  builder->RegisterConditionKey(std::make_unique<CurrentTimeConditionKey>());
  builder->RegisterConditionKey(std::make_unique<ServiceNameConditionKey>());
}

}  // namespace authz_core
