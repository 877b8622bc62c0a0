// Copyright 2021 gRPC authors.
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

#ifndef AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_PATTERN_COMPILER_H
#define AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_PATTERN_COMPILER_H

#include <stddef.h>

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "re2/re2.h"

namespace authz_core {

// Evaluation budget applied to every compiled pattern unless the caller
// provides its own.
constexpr absl::Duration kDefaultRegexMatchTimeout = absl::Milliseconds(250);

// An anchored RE2 expression together with its evaluation budget.
// Immutable once built and safe to share between threads.
class CompiledPattern {
 public:
  CompiledPattern(std::unique_ptr<RE2> regex, absl::Duration match_timeout);

  CompiledPattern(CompiledPattern&& other) noexcept = default;
  CompiledPattern& operator=(CompiledPattern&& other) noexcept = default;

  // Returns whether candidate matches the whole expression.
  // Returns DEADLINE_EXCEEDED if the evaluation took longer than
  // match_timeout(); the match result is discarded in that case.
  absl::StatusOr<bool> Match(absl::string_view candidate) const;

  // The generated RE2 source.
  const std::string& pattern() const { return regex_->pattern(); }
  absl::Duration match_timeout() const { return match_timeout_; }

 private:
  std::unique_ptr<RE2> regex_;
  absl::Duration match_timeout_;
};

// Converts a wildcard pattern, where '*' stands for zero or more arbitrary
// bytes, into an anchored expression.  Every other byte matches literally.
//   - "ecs:Describe*" matches "ecs:DescribeInstances" and "ecs:Describe"
//   - "*" matches any string
//   - "ecs:*:instance/*" matches "ecs:cn-hangzhou:instance/i-001"
// A failure here means RE2 rejected quoted input and is reported as
// INTERNAL.
absl::StatusOr<CompiledPattern> CompileWildcardRegex(
    absl::string_view pattern,
    absl::Duration match_timeout = kDefaultRegexMatchTimeout);

// Returns the [start, end) offsets of every first level span bounded by
// delimiter_start and delimiter_end, flattened as start0, end0, start1, ...
// where end is one past the closing delimiter.  Unbalanced delimiters are
// INVALID_ARGUMENT.
absl::StatusOr<std::vector<size_t>> DelimiterIndices(absl::string_view tpl,
                                                     char delimiter_start,
                                                     char delimiter_end);

// Compiles a template made of literal text and delimited raw RE2 fragments.
// Literal text is quoted, fragments are used verbatim and each becomes one
// capturing group.  It is common to use curly braces as delimiters, but
// characters without a special meaning in regular expressions such as '<'
// and '>' avoid clashing with repetition counts:
//
//   auto pattern =
//       CompileRegexTemplate("foo:bar.baz:<[0-9]{2,10}>", '<', '>');
//   // pattern->Match("foo:bar.baz:123") is true.
//
// Delimiter balance is checked before anything is compiled.
absl::StatusOr<CompiledPattern> CompileRegexTemplate(
    absl::string_view tpl, char delimiter_start, char delimiter_end,
    absl::Duration match_timeout = kDefaultRegexMatchTimeout);

}  // namespace authz_core

#endif  // AUTHZ_SRC_CORE_SECURITY_AUTHORIZATION_PATTERN_COMPILER_H
