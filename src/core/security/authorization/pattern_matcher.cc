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

#include "src/core/security/authorization/pattern_matcher.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "src/core/config/config_vars.h"
#include "src/core/debug/trace.h"

namespace authz_core {

namespace {

size_t EffectiveCacheSize(size_t cache_size) {
  return cache_size == 0 ? PatternMatcher::kDefaultCacheSize : cache_size;
}

}  // namespace

PatternMatcher::Options PatternMatcher::Options::FromConfigVars() {
  const ConfigVars& vars = ConfigVars::Get();
  Options options;
  if (vars.PatternCacheSize() > 0) {
    options.cache_size = static_cast<size_t>(vars.PatternCacheSize());
  }
  if (vars.RegexMatchTimeoutMs() > 0) {
    options.match_timeout = absl::Milliseconds(vars.RegexMatchTimeoutMs());
  }
  return options;
}

PatternMatcher::PatternMatcher(Options options)
    : options_{EffectiveCacheSize(options.cache_size), options.match_timeout},
      cache_(options_.cache_size) {}

absl::StatusOr<bool> PatternMatcher::Matches(
    absl::string_view candidate, absl::string_view patterns) const {
  for (absl::string_view pattern : absl::StrSplit(patterns, ',')) {
    if (!absl::StrContains(pattern, '*')) {
      if (pattern == candidate) return true;
      continue;
    }
    auto matched = MatchWildcard(candidate, pattern);
    if (!matched.ok()) return matched.status();
    if (*matched) return true;
  }
  return false;
}

bool PatternMatcher::MustMatch(absl::string_view candidate,
                               absl::string_view patterns) const {
  auto matched = Matches(candidate, patterns);
  return matched.ok() && *matched;
}

size_t PatternMatcher::CacheSize() const {
  MutexLock lock(&mu_);
  return cache_.size();
}

absl::StatusOr<bool> PatternMatcher::MatchWildcard(
    absl::string_view candidate, absl::string_view pattern) const {
  auto compiled = GetOrCompile(pattern);
  if (!compiled.ok()) return compiled.status();
  auto matched = (*compiled)->Match(candidate);
  if (!matched.ok()) {
    LOG(ERROR) << "pattern \"" << pattern << "\" against \"" << candidate
               << "\": " << matched.status();
    return matched.status();
  }
  AUTHZ_TRACE_LOG(pattern_matcher, INFO)
      << "pattern \"" << pattern << "\" "
      << (*matched ? "matches" : "does not match") << " \"" << candidate
      << "\"";
  return *matched;
}

absl::StatusOr<PatternMatcher::CachedPattern> PatternMatcher::GetOrCompile(
    absl::string_view pattern) const {
  std::string key(pattern);
  {
    MutexLock lock(&mu_);
    auto cached = cache_.Get(key);
    if (cached.has_value()) {
      AUTHZ_TRACE_VLOG(pattern_matcher, 2)
          << "cache hit for pattern \"" << pattern << "\"";
      return std::move(*cached);
    }
  }
  // Compile outside the lock so that a miss does not stall lookups of
  // other patterns.
  auto compiled = CompileWildcardRegex(pattern, options_.match_timeout);
  if (!compiled.ok()) {
    LOG(ERROR) << "failed to compile wildcard pattern \"" << pattern
               << "\": " << compiled.status();
    return compiled.status();
  }
  CachedPattern entry =
      std::make_shared<const CompiledPattern>(std::move(*compiled));
  MutexLock lock(&mu_);
  const bool full = cache_.size() >= cache_.max_size();
  bool inserted = false;
  // Another thread may have cached the same pattern in the meantime; the
  // first entry wins so that at most one compiled form exists per key.
  CachedPattern result = cache_.GetOrInsert(key, [&](const std::string&) {
    inserted = true;
    return entry;
  });
  if (inserted) {
    AUTHZ_TRACE_LOG(pattern_matcher, INFO)
        << "compiled pattern \"" << pattern << "\" as /"
        << result->pattern() << "/"
        << (full ? ", evicted least recently used entry" : "");
  }
  return result;
}

}  // namespace authz_core
