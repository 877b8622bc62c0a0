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

#include "src/core/config/load_config.h"


#include "absl/flags/marshalling.h"
#include "absl/log/log.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "src/core/util/env.h"

namespace authz_core {

namespace {
absl::optional<std::string> LoadEnv(absl::string_view environment_variable) {
  return GetEnv(std::string(environment_variable).c_str());
}
}  // namespace

absl::optional<std::string> LoadConfigFromEnv(
    absl::string_view environment_variable) {
  auto env = LoadEnv(environment_variable);
  if (env.has_value() && env->empty()) return absl::nullopt;
  return env;
}

int32_t LoadConfigFromEnv(absl::string_view environment_variable,
                          int32_t default_value) {
  auto env = LoadConfigFromEnv(environment_variable);
  if (env.has_value()) {
    int32_t out;
    if (absl::SimpleAtoi(*env, &out)) return out;
    LOG(ERROR) << "Error reading int from " << environment_variable
               << ": '" << *env << "' is not a number";
  }
  return default_value;
}

bool LoadConfigFromEnv(absl::string_view environment_variable,
                       bool default_value) {
  auto env = LoadConfigFromEnv(environment_variable);
  if (env.has_value()) {
    bool result;
    std::string error;
    if (absl::ParseFlag(env->c_str(), &result, &error)) return result;
    LOG(ERROR) << "Error reading bool from " << environment_variable
               << ": '" << *env << "' is not a bool: " << error;
  }
  return default_value;
}

std::string LoadConfigFromEnv(absl::string_view environment_variable,
                              const char* default_value) {
  return LoadConfigFromEnv(environment_variable).value_or(default_value);
}

std::string LoadConfig(const absl::Flag<std::vector<std::string>>& flag,
                       absl::string_view environment_variable,
                       const absl::optional<std::string>& override,
                       const char* default_value) {
  if (override.has_value()) return *override;
  auto from_flag = absl::GetFlag(flag);
  if (!from_flag.empty()) return absl::StrJoin(from_flag, ",");
  return LoadConfigFromEnv(environment_variable, default_value);
}

}  // namespace authz_core
