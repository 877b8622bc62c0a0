//
//
// Copyright 2015 gRPC authors.
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

#include "src/core/util/env.h"

#include <stdlib.h>

#include "absl/log/check.h"

namespace authz_core {

std::optional<std::string> GetEnv(const char* name) {
  char* result = getenv(name);
  if (result == nullptr) return std::nullopt;
  return result;
}

void SetEnv(const char* name, const char* value) {
  int res = setenv(name, value, 1);
  CHECK_EQ(res, 0) << "setenv(" << name << ") failed";
}

void UnsetEnv(const char* name) {
  int res = unsetenv(name);
  CHECK_EQ(res, 0) << "unsetenv(" << name << ") failed";
}

}  // namespace authz_core
