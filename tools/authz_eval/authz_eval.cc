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

// Evaluates a single authorization primitive from the command line:
//
//   authz_eval --candidate=ecs:DescribeInstances --patterns='ecs:Describe*'
//   authz_eval --context='{"inf:SourceIP":"10.0.0.1"}' \
//       --condition='{"IPAddress":{"inf:SourceIP":["10.0.0.0/8"]}}'
//   authz_eval --regex_template='user:<[0-9]+>' --candidate=user:42
//   authz_eval --dump_context --context='{"acs:Count": 3, "acs:Mfa": true}'
//
// Exits 0 on match/allow, 1 on no match/deny and 2 on error.

#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "src/core/config/config_vars.h"
#include "src/core/security/authorization/condition.h"
#include "src/core/security/authorization/condition_evaluator.h"
#include "src/core/security/authorization/pattern_compiler.h"
#include "src/core/security/authorization/pattern_matcher.h"
#include "src/core/util/json/json_reader.h"
#include "src/core/util/json/json_writer.h"
#include "src/core/util/log.h"

ABSL_FLAG(std::string, candidate, "",
          "Identifier to match against --patterns or --regex_template.");
ABSL_FLAG(std::string, patterns, "",
          "Comma separated wildcard pattern list, e.g. 'ecs:Get*,ecs:List*'.");
ABSL_FLAG(std::string, regex_template, "",
          "Regex template with delimited raw fragments, e.g. 'id:<[0-9]+>'.");
ABSL_FLAG(std::string, delimiters, "<>",
          "Open and close delimiter characters for --regex_template.");
ABSL_FLAG(std::string, context, "{}",
          "JSON object of request attributes for --condition.");
ABSL_FLAG(std::string, condition, "",
          "JSON condition block, e.g. '{\"StringEquals\":{\"k\":[\"v\"]}}'.");
ABSL_FLAG(bool, dump_context, false,
          "Print --context as the evaluator decodes it and exit.");

namespace {

constexpr int kExitMatch = 0;
constexpr int kExitNoMatch = 1;
constexpr int kExitError = 2;

int Report(const absl::StatusOr<bool>& result, const char* yes,
           const char* no) {
  if (!result.ok()) {
    std::cerr << result.status() << std::endl;
    return kExitError;
  }
  std::cout << (*result ? yes : no) << std::endl;
  return *result ? kExitMatch : kExitNoMatch;
}

absl::StatusOr<bool> MatchTemplate(const std::string& tpl,
                                   const std::string& delimiters,
                                   const std::string& candidate) {
  if (delimiters.size() != 2) {
    return absl::InvalidArgumentError(
        "--delimiters must be exactly two characters");
  }
  auto compiled = authz_core::CompileRegexTemplate(
      tpl, delimiters[0], delimiters[1],
      absl::Milliseconds(
          authz_core::ConfigVars::Get().RegexMatchTimeoutMs()));
  if (!compiled.ok()) return compiled.status();
  return compiled->Match(candidate);
}

// Prints the attribute types the evaluator will see, e.g. that "3" stays a
// string while 3 becomes a number.
int DumpContext(const std::string& context_json) {
  auto doc = authz_core::JsonParse(context_json);
  if (!doc.ok()) {
    std::cerr << doc.status() << std::endl;
    return kExitError;
  }
  auto context = authz_core::ParseConditionContext(*doc);
  if (!context.ok()) {
    std::cerr << context.status() << std::endl;
    return kExitError;
  }
  authz_core::Json json = authz_core::ConditionContextToJson(*context);
  std::cout << authz_core::JsonDump(json, /*indent=*/2) << std::endl;
  return kExitMatch;
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      "Evaluates wildcard patterns, regex templates and condition blocks.");
  absl::ParseCommandLine(argc, argv);
  authz_core::InitLogVerbosity();

  std::string candidate = absl::GetFlag(FLAGS_candidate);
  std::string condition = absl::GetFlag(FLAGS_condition);
  std::string tpl = absl::GetFlag(FLAGS_regex_template);

  if (absl::GetFlag(FLAGS_dump_context)) {
    return DumpContext(absl::GetFlag(FLAGS_context));
  }

  if (!condition.empty()) {
    return Report(authz_core::EvaluateConditions(absl::GetFlag(FLAGS_context),
                                                 condition),
                  "allow", "deny");
  }
  if (!tpl.empty()) {
    return Report(
        MatchTemplate(tpl, absl::GetFlag(FLAGS_delimiters), candidate),
        "match", "no match");
  }
  std::string patterns = absl::GetFlag(FLAGS_patterns);
  if (patterns.empty()) {
    std::cerr << "One of --patterns, --regex_template or --condition is "
                 "required."
              << std::endl;
    return kExitError;
  }
  authz_core::PatternMatcher matcher(
      authz_core::PatternMatcher::Options::FromConfigVars());
  return Report(matcher.Matches(candidate, patterns), "match", "no match");
}
