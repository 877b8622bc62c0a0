//
//
// Copyright 2024 gRPC authors.
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

#include "src/core/util/log.h"

#include "absl/log/globals.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "src/core/config/config_vars.h"

namespace authz_core {

namespace {

constexpr absl::string_view kAuthzSources = "*authz*/*";

struct NamedVerbosity {
  absl::string_view name;
  LogVerbosity verbosity;
};

constexpr NamedVerbosity kVerbosities[] = {
    {"DEBUG", {absl::LogSeverityAtLeast::kInfo, 2, true}},
    {"INFO", {absl::LogSeverityAtLeast::kInfo, -1, true}},
    {"ERROR", {absl::LogSeverityAtLeast::kError, -1, false}},
    {"NONE", {absl::LogSeverityAtLeast::kInfinity, -1, false}},
};

}  // namespace

absl::StatusOr<LogVerbosity> ParseLogVerbosity(absl::string_view name) {
  for (const NamedVerbosity& entry : kVerbosities) {
    if (absl::EqualsIgnoreCase(name, entry.name)) return entry.verbosity;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("unknown log verbosity \"", name, "\""));
}

void InitLogVerbosity() {
  absl::string_view name = ConfigVars::Get().Verbosity();
  if (name.empty()) return;
  absl::StatusOr<LogVerbosity> verbosity = ParseLogVerbosity(name);
  if (!verbosity.ok()) {
    LOG(ERROR) << verbosity.status().message();
    return;
  }
  if (verbosity->debug_only) {
    LOG_FIRST_N(WARNING, 1)
        << "AUTHZ_VERBOSITY=" << name
        << " is not suitable for production, prefer ERROR.";
  }
  absl::SetVLogLevel(kAuthzSources, verbosity->vlog_level);
  absl::SetMinLogLevel(verbosity->min_level);
}

}  // namespace authz_core
