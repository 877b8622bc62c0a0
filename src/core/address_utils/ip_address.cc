//
//
// Copyright 2016 gRPC authors.
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
//
//

#include "src/core/address_utils/ip_address.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <string.h>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

namespace authz_core {

namespace {

constexpr uint8_t kV4MappedPrefix[12] = {0, 0, 0, 0, 0,    0,
                                         0, 0, 0, 0, 0xff, 0xff};

}  // namespace

std::optional<IpAddress> IpAddress::Parse(absl::string_view text) {
  // inet_pton() wants a NUL terminated string.  Anything longer than the
  // longest textual IPv6 address cannot be valid.
  char buf[INET6_ADDRSTRLEN];
  if (text.empty() || text.size() >= sizeof(buf)) return std::nullopt;
  memcpy(buf, text.data(), text.size());
  buf[text.size()] = '\0';
  std::array<uint8_t, 16> bytes{};
  if (text.find(':') == absl::string_view::npos) {
    struct in_addr addr4;
    if (inet_pton(AF_INET, buf, &addr4) != 1) return std::nullopt;
    memcpy(bytes.data(), kV4MappedPrefix, sizeof(kV4MappedPrefix));
    memcpy(bytes.data() + 12, &addr4, 4);
  } else {
    struct in6_addr addr6;
    if (inet_pton(AF_INET6, buf, &addr6) != 1) return std::nullopt;
    memcpy(bytes.data(), &addr6, 16);
  }
  return IpAddress(bytes);
}

bool IpAddress::is_ipv4() const {
  return memcmp(bytes_.data(), kV4MappedPrefix, sizeof(kV4MappedPrefix)) == 0;
}

std::string IpAddress::ToString() const {
  char buf[INET6_ADDRSTRLEN];
  const char* result;
  if (is_ipv4()) {
    result = inet_ntop(AF_INET, bytes_.data() + 12, buf, sizeof(buf));
  } else {
    result = inet_ntop(AF_INET6, bytes_.data(), buf, sizeof(buf));
  }
  if (result == nullptr) return "";
  return result;
}

absl::StatusOr<CidrRange> CidrRange::Parse(absl::string_view text) {
  size_t slash = text.rfind('/');
  if (slash == absl::string_view::npos) {
    return absl::InvalidArgumentError(
        absl::StrCat("CIDR range \"", text, "\" has no prefix length"));
  }
  absl::string_view address_text = text.substr(0, slash);
  absl::string_view prefix_text = text.substr(slash + 1);
  std::optional<IpAddress> address = IpAddress::Parse(address_text);
  if (!address.has_value()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "CIDR range \"", text, "\" has an invalid address"));
  }
  uint32_t prefix_len;
  bool digits_only = !prefix_text.empty() && prefix_text.size() <= 3;
  for (char c : prefix_text) {
    if (!absl::ascii_isdigit(c)) digits_only = false;
  }
  const bool ipv6_notation = address_text.find(':') != absl::string_view::npos;
  const uint32_t max_prefix_len = ipv6_notation ? 128 : 32;
  if (!digits_only || !absl::SimpleAtoi(prefix_text, &prefix_len) ||
      prefix_len > max_prefix_len) {
    return absl::InvalidArgumentError(absl::StrCat(
        "CIDR range \"", text, "\" has an invalid prefix length"));
  }
  CidrRange range(*address, prefix_len, ipv6_notation);
  // Clear the host bits.
  const uint32_t mask_bits = range.mask_bits();
  std::array<uint8_t, 16>& bytes = range.address_.bytes_;
  for (uint32_t i = 0; i < 16; ++i) {
    const uint32_t bit = i * 8;
    if (bit >= mask_bits) {
      bytes[i] = 0;
    } else if (mask_bits - bit < 8) {
      bytes[i] &= static_cast<uint8_t>(0xff << (8 - (mask_bits - bit)));
    }
  }
  return range;
}

bool CidrRange::Contains(const IpAddress& address) const {
  if (address.is_ipv4() != address_.is_ipv4()) return false;
  const uint32_t mask_bits = this->mask_bits();
  const auto& lhs = address.bytes();
  const auto& rhs = address_.bytes();
  const uint32_t full_bytes = mask_bits / 8;
  if (memcmp(lhs.data(), rhs.data(), full_bytes) != 0) return false;
  const uint32_t remaining_bits = mask_bits % 8;
  if (remaining_bits == 0) return true;
  const uint8_t mask = static_cast<uint8_t>(0xff << (8 - remaining_bits));
  return (lhs[full_bytes] & mask) == (rhs[full_bytes] & mask);
}

std::string CidrRange::ToString() const {
  if (ipv6_notation_ && address_.is_ipv4()) {
    return absl::StrCat("::ffff:", address_.ToString(), "/", prefix_len_);
  }
  return absl::StrCat(address_.ToString(), "/", prefix_len_);
}

}  // namespace authz_core
