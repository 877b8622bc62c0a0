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

#ifndef AUTHZ_SRC_CORE_ADDRESS_UTILS_IP_ADDRESS_H
#define AUTHZ_SRC_CORE_ADDRESS_UTILS_IP_ADDRESS_H

#include <stdint.h>

#include <array>
#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace authz_core {

// An IPv4 or IPv6 address literal.  IPv4 addresses are held in their
// IPv4-mapped IPv6 form, so "10.0.0.1" and "::ffff:10.0.0.1" are the same
// address and both report is_ipv4().
class IpAddress {
 public:
  // Accepts dotted-quad IPv4 or RFC 4291 IPv6 text.  Ports, brackets and
  // zone identifiers are rejected.
  static std::optional<IpAddress> Parse(absl::string_view text);

  bool is_ipv4() const;
  const std::array<uint8_t, 16>& bytes() const { return bytes_; }
  std::string ToString() const;

  bool operator==(const IpAddress& other) const {
    return bytes_ == other.bytes_;
  }
  bool operator!=(const IpAddress& other) const { return !(*this == other); }

 private:
  explicit IpAddress(const std::array<uint8_t, 16>& bytes) : bytes_(bytes) {}

  friend class CidrRange;

  std::array<uint8_t, 16> bytes_;
};

// An address prefix such as "192.168.0.0/24" or "2001:db8::/32".
//
// The prefix length is bounded by the notation, not by the address family:
// "::ffff:10.0.0.0/104" is IPv6 notation and covers the same IPv4 addresses
// as "10.0.0.0/8".
class CidrRange {
 public:
  // Host bits beyond the prefix are ignored, so "192.168.1.1/16" is the
  // same range as "192.168.0.0/16".
  static absl::StatusOr<CidrRange> Parse(absl::string_view text);

  // Only addresses of the same family can be contained.
  bool Contains(const IpAddress& address) const;

  const IpAddress& address() const { return address_; }
  // Prefix length as written: 0..32 in dotted-quad notation, 0..128
  // otherwise.
  uint32_t prefix_len() const { return prefix_len_; }
  std::string ToString() const;

  // Ranges covering the same addresses are equal, whatever the notation.
  bool operator==(const CidrRange& other) const {
    return address_ == other.address_ && mask_bits() == other.mask_bits();
  }

 private:
  CidrRange(IpAddress address, uint32_t prefix_len, bool ipv6_notation)
      : address_(address),
        prefix_len_(prefix_len),
        ipv6_notation_(ipv6_notation) {}

  // Number of leading bits of the 16 byte form that must match.
  uint32_t mask_bits() const {
    return ipv6_notation_ ? prefix_len_ : prefix_len_ + 96;
  }

  IpAddress address_;
  uint32_t prefix_len_;
  bool ipv6_notation_;
};

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_ADDRESS_UTILS_IP_ADDRESS_H
