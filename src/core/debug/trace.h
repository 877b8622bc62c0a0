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

#ifndef AUTHZ_SRC_CORE_DEBUG_TRACE_H
#define AUTHZ_SRC_CORE_DEBUG_TRACE_H

#include <atomic>
#include <map>
#include <string>

#include "absl/base/optimization.h"
#include "absl/log/log.h"
#include "absl/strings/string_view.h"

namespace authz_core {

// A named switch for verbose, per-subsystem debug logging.  The set of
// enabled flags is read from ConfigVars::Trace() the first time any flag is
// queried, and can be changed afterwards with ParseTracers().
class TraceFlag {
 public:
  TraceFlag(bool default_enabled, const char* name);
  // TraceFlag needs to be trivially destructible since it is used as global
  // variable.
  ~TraceFlag() = default;

  const char* name() const { return name_; }

  bool enabled() {
    if (ABSL_PREDICT_FALSE(
            !tracers_initialized_.load(std::memory_order_acquire))) {
      InitTracersFromConfig();
    }
    return value_.load(std::memory_order_relaxed);
  }

  void set_enabled(bool enabled) {
    value_.store(enabled, std::memory_order_relaxed);
  }

 private:
  friend void InitTracersFromConfig();
  static std::atomic<bool> tracers_initialized_;

  const char* const name_;
  std::atomic<bool> value_;
};

extern TraceFlag pattern_matcher_trace;
extern TraceFlag condition_eval_trace;
extern TraceFlag condition_keys_trace;

// Applies the AUTHZ_TRACE config value once.  Safe to call repeatedly.
void InitTracersFromConfig();

// Enables or disables tracers from a comma separated list.  "all" selects
// every tracer and a leading '-' disables the named tracer instead.
// Returns false if any name was not recognized.
bool ParseTracers(absl::string_view tracers);

// All registered flags, keyed by name.
std::map<absl::string_view, TraceFlag*> GetAllTraceFlags();

// Restores every tracer to the state it had at construction time.
class SavedTraceFlags {
 public:
  SavedTraceFlags();
  void Restore();

 private:
  std::map<std::string, bool> values_;
};

}  // namespace authz_core

#define AUTHZ_TRACE_FLAG_ENABLED_OBJ(obj) ABSL_PREDICT_FALSE((obj).enabled())

#define AUTHZ_TRACE_FLAG_ENABLED(tracer) \
  ABSL_PREDICT_FALSE((authz_core::tracer##_trace).enabled())

#define AUTHZ_TRACE_LOG(tracer, level) \
  LOG_IF(level, AUTHZ_TRACE_FLAG_ENABLED(tracer))

#define AUTHZ_TRACE_VLOG(tracer, level) \
  if (AUTHZ_TRACE_FLAG_ENABLED(tracer)) VLOG(level)

#endif  // AUTHZ_SRC_CORE_DEBUG_TRACE_H
