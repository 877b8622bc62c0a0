//
//
// Copyright 2017 gRPC authors.
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

#ifndef AUTHZ_TEST_CORE_UTIL_SCOPED_ENV_VAR_H
#define AUTHZ_TEST_CORE_UTIL_SCOPED_ENV_VAR_H

#include <optional>
#include <string>

#include "src/core/util/env.h"

namespace authz_core {
namespace testing {

// Sets an environment variable for the lifetime of the object and restores
// its previous value (or absence) afterwards.
class ScopedEnvVar {
 public:
  ScopedEnvVar(const char* env_var, const char* value)
      : env_var_(env_var), previous_(GetEnv(env_var)) {
    SetEnv(env_var_, value);
  }

  ScopedEnvVar(const ScopedEnvVar&) = delete;
  ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

  ~ScopedEnvVar() {
    if (previous_.has_value()) {
      SetEnv(env_var_, *previous_);
    } else {
      UnsetEnv(env_var_);
    }
  }

 private:
  const char* env_var_;
  std::optional<std::string> previous_;
};

}  // namespace testing
}  // namespace authz_core

#endif  // AUTHZ_TEST_CORE_UTIL_SCOPED_ENV_VAR_H
