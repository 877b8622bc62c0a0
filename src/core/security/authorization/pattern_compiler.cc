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

#include "src/core/security/authorization/pattern_compiler.h"

#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/time/clock.h"

namespace authz_core {

namespace {

re2::StringPiece ToStringPiece(absl::string_view s) {
  return re2::StringPiece(s.data(), s.size());
}

std::string QuoteMeta(absl::string_view literal) {
  return RE2::QuoteMeta(ToStringPiece(literal));
}

RE2::Options WildcardOptions() {
  RE2::Options options;
  // Match byte by byte so that '*' can never split or reject a multi-byte
  // sequence, and let it span newlines.
  options.set_encoding(RE2::Options::EncodingLatin1);
  options.set_dot_nl(true);
  options.set_log_errors(false);
  return options;
}

RE2::Options TemplateOptions() {
  RE2::Options options;
  options.set_log_errors(false);
  return options;
}

}  // namespace

//
// CompiledPattern
//

CompiledPattern::CompiledPattern(std::unique_ptr<RE2> regex,
                                 absl::Duration match_timeout)
    : regex_(std::move(regex)), match_timeout_(match_timeout) {}

absl::StatusOr<bool> CompiledPattern::Match(absl::string_view candidate) const {
  // RE2 runs in time linear in the input, so the evaluation cannot run away;
  // the budget still bounds pathological inputs and is reported distinctly
  // from a non-match.
  const absl::Time start = absl::Now();
  const bool matched = RE2::FullMatch(ToStringPiece(candidate), *regex_);
  const absl::Duration elapsed = absl::Now() - start;
  if (elapsed > match_timeout_) {
    return absl::DeadlineExceededError(absl::StrFormat(
        "match timeout: evaluating /%s/ took %s, budget is %s", pattern(),
        absl::FormatDuration(elapsed), absl::FormatDuration(match_timeout_)));
  }
  return matched;
}

//
// Compilers
//

absl::StatusOr<CompiledPattern> CompileWildcardRegex(
    absl::string_view pattern, absl::Duration match_timeout) {
  std::string regex = "^";
  size_t pos = 0;
  while (pos < pattern.size()) {
    size_t star = pattern.find('*', pos);
    absl::StrAppend(&regex, QuoteMeta(pattern.substr(pos, star - pos)));
    if (star == absl::string_view::npos) break;
    // Runs of '*' collapse into a single ".*".
    absl::StrAppend(&regex, ".*");
    pos = pattern.find_first_not_of('*', star);
  }
  regex.push_back('$');
  auto re = std::make_unique<RE2>(regex, WildcardOptions());
  if (!re->ok()) {
    return absl::InternalError(
        absl::StrCat("Failed to compile wildcard pattern \"", pattern,
                     "\": ", re->error()));
  }
  return CompiledPattern(std::move(re), match_timeout);
}

absl::StatusOr<std::vector<size_t>> DelimiterIndices(absl::string_view tpl,
                                                     char delimiter_start,
                                                     char delimiter_end) {
  if (delimiter_start == delimiter_end) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Template delimiters must differ, got '%c' twice", delimiter_start));
  }
  int level = 0;
  size_t idx = 0;
  std::vector<size_t> idxs;
  for (size_t i = 0; i < tpl.size(); ++i) {
    if (tpl[i] == delimiter_start) {
      if (++level == 1) idx = i;
    } else if (tpl[i] == delimiter_end) {
      if (--level == 0) {
        idxs.push_back(idx);
        idxs.push_back(i + 1);
      } else if (level < 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Unbalanced delimiters in \"", tpl, "\""));
      }
    }
  }
  if (level != 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unbalanced delimiters in \"", tpl, "\""));
  }
  return idxs;
}

absl::StatusOr<CompiledPattern> CompileRegexTemplate(
    absl::string_view tpl, char delimiter_start, char delimiter_end,
    absl::Duration match_timeout) {
  // Check if it is well-formed.
  auto idxs = DelimiterIndices(tpl, delimiter_start, delimiter_end);
  if (!idxs.ok()) return idxs.status();
  std::string pattern = "^";
  size_t end = 0;
  for (size_t i = 0; i < idxs->size(); i += 2) {
    absl::string_view raw = tpl.substr(end, (*idxs)[i] - end);
    end = (*idxs)[i + 1];
    absl::string_view fragment =
        tpl.substr((*idxs)[i] + 1, end - (*idxs)[i] - 2);
    // Validate each fragment on its own so the error names the culprit.
    RE2 fragment_regex(absl::StrCat("^", fragment, "$"), TemplateOptions());
    if (!fragment_regex.ok()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid regex fragment \"", fragment,
                       "\" in template: ", fragment_regex.error()));
    }
    absl::StrAppend(&pattern, QuoteMeta(raw), "(", fragment, ")");
  }
  // Add the remaining.
  absl::StrAppend(&pattern, QuoteMeta(tpl.substr(end)), "$");
  auto re = std::make_unique<RE2>(pattern, TemplateOptions());
  if (!re->ok()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid regex string specified in template: ", re->error()));
  }
  return CompiledPattern(std::move(re), match_timeout);
}

}  // namespace authz_core
