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

#ifndef AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_PATTERN_MATCHER_H
#define AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_PATTERN_MATCHER_H

#include <stddef.h>

#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "src/core/security/authorization/pattern_compiler.h"
#include "src/core/util/lru_cache.h"
#include "src/core/util/sync.h"

namespace authz_core {

// Matches request identifiers (resource names, action names) against the
// comma separated wildcard pattern lists found in policies.
//
// Compiled patterns are kept in a bounded LRU cache keyed by the pattern
// text.  The cache only affects latency: a result never depends on whether a
// pattern was cached.  All methods are thread-safe.
class PatternMatcher {
 public:
  static constexpr size_t kDefaultCacheSize = 512;

  struct Options {
    // Maximum number of compiled patterns kept.  0 selects
    // kDefaultCacheSize.
    size_t cache_size = kDefaultCacheSize;
    absl::Duration match_timeout = kDefaultRegexMatchTimeout;

    // Options from ConfigVars::PatternCacheSize() and
    // ConfigVars::RegexMatchTimeoutMs().
    static Options FromConfigVars();
  };

  PatternMatcher() : PatternMatcher(Options()) {}
  explicit PatternMatcher(Options options);

  PatternMatcher(const PatternMatcher&) = delete;
  PatternMatcher& operator=(const PatternMatcher&) = delete;

  // Returns true if candidate matches any element of the comma separated
  // pattern list.  Elements without '*' must equal candidate exactly.
  // A plain non-match is false; an error is only returned when compiling or
  // evaluating a wildcard element fails, e.g. DEADLINE_EXCEEDED when the
  // evaluation budget is exhausted.
  absl::StatusOr<bool> Matches(absl::string_view candidate,
                               absl::string_view patterns) const;

  // Same as Matches(), but any error is treated as a non-match.
  bool MustMatch(absl::string_view candidate,
                 absl::string_view patterns) const;

  // Number of compiled patterns currently cached.
  size_t CacheSize() const;

  const Options& options() const { return options_; }

 private:
  using CachedPattern = std::shared_ptr<const CompiledPattern>;

  absl::StatusOr<bool> MatchWildcard(absl::string_view candidate,
                                     absl::string_view pattern) const;
  absl::StatusOr<CachedPattern> GetOrCompile(absl::string_view pattern) const;

  const Options options_;
  mutable Mutex mu_;
  mutable LruCache<std::string, CachedPattern> cache_ ABSL_GUARDED_BY(mu_);
};

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_PATTERN_MATCHER_H
