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

#ifndef AUTHZ_SRC_CORE_UTIL_LOG_H
#define AUTHZ_SRC_CORE_UTIL_LOG_H

#include "absl/base/log_severity.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace authz_core {

// Logging settings selected by one AUTHZ_VERBOSITY value.
struct LogVerbosity {
  absl::LogSeverityAtLeast min_level;
  // Applied to authz source files only; -1 turns VLOG off.
  int vlog_level;
  // Levels chatty enough to hurt a production deployment.
  bool debug_only;
};

// Maps "DEBUG", "INFO", "ERROR" or "NONE" (any case) to its settings.
absl::StatusOr<LogVerbosity> ParseLogVerbosity(absl::string_view name);

// Applies ConfigVars::Verbosity() to the absl logging globals. An empty value
// leaves them alone. SetMinLogLevel is process wide, so only binaries call
// this, never the library.
void InitLogVerbosity();

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_UTIL_LOG_H
