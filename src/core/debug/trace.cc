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

#include "src/core/debug/trace.h"

#include <vector>

#include "absl/base/call_once.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "src/core/config/config_vars.h"

namespace authz_core {

std::atomic<bool> TraceFlag::tracers_initialized_{false};

TraceFlag pattern_matcher_trace(false, "pattern_matcher");
TraceFlag condition_eval_trace(false, "condition_eval");
TraceFlag condition_keys_trace(false, "condition_keys");

TraceFlag::TraceFlag(bool default_enabled, const char* name)
    : name_(name), value_(default_enabled) {}

std::map<absl::string_view, TraceFlag*> GetAllTraceFlags() {
  return {
      {pattern_matcher_trace.name(), &pattern_matcher_trace},
      {condition_eval_trace.name(), &condition_eval_trace},
      {condition_keys_trace.name(), &condition_keys_trace},
  };
}

namespace {

absl::once_flag g_init_tracers_once;

bool ApplyTracers(absl::string_view tracers) {
  if (tracers.empty()) return true;
  auto all_flags = GetAllTraceFlags();
  bool ok = true;
  for (absl::string_view name :
       absl::StrSplit(tracers, ',', absl::SkipWhitespace())) {
    name = absl::StripAsciiWhitespace(name);
    const bool enabled = !absl::ConsumePrefix(&name, "-");
    if (name == "all") {
      for (auto& flag : all_flags) {
        flag.second->set_enabled(enabled);
      }
      continue;
    }
    auto it = all_flags.find(name);
    if (it == all_flags.end()) {
      LOG(ERROR) << "Unknown tracer: " << name;
      ok = false;
      continue;
    }
    it->second->set_enabled(enabled);
  }
  return ok;
}

}  // namespace

void InitTracersFromConfig() {
  absl::call_once(g_init_tracers_once, []() {
    ApplyTracers(ConfigVars::Get().Trace());
    TraceFlag::tracers_initialized_.store(true, std::memory_order_release);
  });
}

bool ParseTracers(absl::string_view tracers) {
  InitTracersFromConfig();
  return ApplyTracers(tracers);
}

SavedTraceFlags::SavedTraceFlags() {
  InitTracersFromConfig();
  for (const auto& flag : GetAllTraceFlags()) {
    values_[std::string(flag.first)] = flag.second->enabled();
  }
}

void SavedTraceFlags::Restore() {
  for (const auto& flag : GetAllTraceFlags()) {
    flag.second->set_enabled(values_[std::string(flag.first)]);
  }
}

}  // namespace authz_core
