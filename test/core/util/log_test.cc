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

#include "absl/base/log_severity.h"
#include "absl/log/globals.h"
#include "absl/status/status.h"
#include "gtest/gtest.h"
#include "src/core/config/config_vars.h"

namespace authz_core {
namespace {

TEST(LogVerbosityTest, KnownNamesAnyCase) {
  auto debug = ParseLogVerbosity("debug");
  ASSERT_TRUE(debug.ok()) << debug.status();
  EXPECT_EQ(debug->min_level, absl::LogSeverityAtLeast::kInfo);
  EXPECT_EQ(debug->vlog_level, 2);
  EXPECT_TRUE(debug->debug_only);

  auto info = ParseLogVerbosity("Info");
  ASSERT_TRUE(info.ok()) << info.status();
  EXPECT_EQ(info->vlog_level, -1);
  EXPECT_TRUE(info->debug_only);

  auto error = ParseLogVerbosity("ERROR");
  ASSERT_TRUE(error.ok()) << error.status();
  EXPECT_EQ(error->min_level, absl::LogSeverityAtLeast::kError);
  EXPECT_FALSE(error->debug_only);

  auto none = ParseLogVerbosity("none");
  ASSERT_TRUE(none.ok()) << none.status();
  EXPECT_EQ(none->min_level, absl::LogSeverityAtLeast::kInfinity);
}

TEST(LogVerbosityTest, UnknownNameIsRejected) {
  auto verbosity = ParseLogVerbosity("loud");
  ASSERT_FALSE(verbosity.ok());
  EXPECT_EQ(verbosity.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_FALSE(ParseLogVerbosity("").ok());
}

class InitLogVerbosityTest : public ::testing::Test {
 protected:
  void SetUp() override { saved_ = absl::MinLogLevel(); }
  void TearDown() override {
    absl::SetMinLogLevel(saved_);
    ConfigVars::Reset();
  }

  static void SetVerbosity(const char* name) {
    ConfigVars::Overrides overrides;
    overrides.verbosity = name;
    ConfigVars::SetOverrides(overrides);
  }

 private:
  absl::LogSeverityAtLeast saved_;
};

TEST_F(InitLogVerbosityTest, AppliesConfiguredLevel) {
  SetVerbosity("ERROR");
  InitLogVerbosity();
  EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kError);
}

TEST_F(InitLogVerbosityTest, UnknownLevelLeavesGlobalsAlone) {
  absl::SetMinLogLevel(absl::LogSeverityAtLeast::kWarning);
  SetVerbosity("loud");
  InitLogVerbosity();
  EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kWarning);
}

}  // namespace
}  // namespace authz_core
