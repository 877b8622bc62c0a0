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

#include "src/core/config/config_vars.h"

#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "src/core/config/load_config.h"

ABSL_FLAG(absl::optional<int32_t>, authz_pattern_cache_size, {},
          "Maximum number of compiled wildcard patterns kept per matcher.");
ABSL_FLAG(absl::optional<int32_t>, authz_regex_match_timeout_ms, {},
          "Time budget for evaluating one compiled pattern, in milliseconds.");
ABSL_FLAG(std::vector<std::string>, authz_trace, {},
          "A comma separated list of tracers that provide additional insight "
          "into how authz evaluates patterns and conditions via debug logs.");
ABSL_FLAG(absl::optional<std::string>, authz_verbosity, {},
          "Logging verbosity: DEBUG, INFO, ERROR or NONE.");

namespace authz_core {

std::atomic<ConfigVars*> ConfigVars::config_vars_{nullptr};

ConfigVars::ConfigVars(const Overrides& overrides)
    : pattern_cache_size_(LoadConfig(FLAGS_authz_pattern_cache_size,
                                     "AUTHZ_PATTERN_CACHE_SIZE",
                                     overrides.pattern_cache_size, 512)),
      regex_match_timeout_ms_(LoadConfig(FLAGS_authz_regex_match_timeout_ms,
                                         "AUTHZ_REGEX_MATCH_TIMEOUT_MS",
                                         overrides.regex_match_timeout_ms,
                                         250)),
      trace_(LoadConfig(FLAGS_authz_trace, "AUTHZ_TRACE", overrides.trace,
                        "")),
      verbosity_(LoadConfig(FLAGS_authz_verbosity, "AUTHZ_VERBOSITY",
                            overrides.verbosity, "")) {}

const ConfigVars& ConfigVars::Load() {
  auto* vars = new ConfigVars({});
  ConfigVars* expected = nullptr;
  if (!config_vars_.compare_exchange_strong(expected, vars,
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
    delete vars;
    return *expected;
  }
  return *vars;
}

void ConfigVars::Reset() {
  delete config_vars_.exchange(nullptr, std::memory_order_acq_rel);
}

void ConfigVars::SetOverrides(const Overrides& overrides) {
  delete config_vars_.exchange(new ConfigVars(overrides),
                               std::memory_order_acq_rel);
}

std::string ConfigVars::ToString() const {
  return absl::StrCat("pattern_cache_size: ", PatternCacheSize(),
                      ", regex_match_timeout_ms: ", RegexMatchTimeoutMs(),
                      ", trace: \"", absl::CEscape(Trace()), "\"",
                      ", verbosity: \"", absl::CEscape(Verbosity()), "\"");
}

}  // namespace authz_core
