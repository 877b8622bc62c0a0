//
//
// Copyright 2019 gRPC authors.
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

#ifndef AUTHZ_SRC_CORE_UTIL_SYNC_H
#define AUTHZ_SRC_CORE_UTIL_SYNC_H

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace authz_core {

using Mutex = absl::Mutex;
using MutexLock = absl::MutexLock;

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_UTIL_SYNC_H
