// Copyright 2023 gRPC authors.
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

#ifndef AUTHZ_SRC_CORE_CONFIG_CONFIG_VARS_H
#define AUTHZ_SRC_CORE_CONFIG_CONFIG_VARS_H

#include <stdint.h>

#include <atomic>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace authz_core {

// Process wide tunables.  Each value comes from (in order of precedence)
// SetOverrides(), the matching --authz_* command line flag, the matching
// AUTHZ_* environment variable, or the built-in default.
class ConfigVars {
 public:
  struct Overrides {
    absl::optional<int32_t> pattern_cache_size;
    absl::optional<int32_t> regex_match_timeout_ms;
    absl::optional<std::string> trace;
    absl::optional<std::string> verbosity;
  };
  ConfigVars(const ConfigVars&) = delete;
  ConfigVars& operator=(const ConfigVars&) = delete;
  // Get the core configuration; if it does not exist, create it.
  static const ConfigVars& Get() {
    auto* p = config_vars_.load(std::memory_order_acquire);
    if (p != nullptr) return *p;
    return Load();
  }
  static void SetOverrides(const Overrides& overrides);
  // Drop the config vars. Users must ensure no other threads are
  // accessing the configuration.
  static void Reset();
  std::string ToString() const;
  // Maximum number of compiled wildcard patterns retained by a
  // PatternMatcher.
  int32_t PatternCacheSize() const { return pattern_cache_size_; }
  // Evaluation budget for a single compiled pattern, in milliseconds.
  int32_t RegexMatchTimeoutMs() const { return regex_match_timeout_ms_; }
  // A comma separated list of tracers that provide additional insight into
  // how authz processes requests via debug logs.
  absl::string_view Trace() const { return trace_; }
  // Logging verbosity: DEBUG, INFO, ERROR or NONE.
  absl::string_view Verbosity() const { return verbosity_; }

 private:
  explicit ConfigVars(const Overrides& overrides);
  static const ConfigVars& Load();
  static std::atomic<ConfigVars*> config_vars_;
  int32_t pattern_cache_size_;
  int32_t regex_match_timeout_ms_;
  std::string trace_;
  std::string verbosity_;
};

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_CONFIG_CONFIG_VARS_H
