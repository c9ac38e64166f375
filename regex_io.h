/*  Copyright 2020-2025 The ruler authors.

    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

        https://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License. */

/*
Patterns are written bare, without delimiters, and always run to the end of
the input they are parsed from. The syntax is a small subset of the usual one:

  abc         literal characters, contracted into a single RegexString
  .           any character, including newline
  [a-z_] [^x] character sets, with ranges only inside 0-9, A-Z, or a-z
  \n \t \r    the usual escapes, plus \xHH and escaped metacharacters
  \d \w \s    shorthand classes, also allowed inside sets
  \D \W \S    their negations, not allowed inside sets
  ^ $ \b      anchors
  (...) |     grouping and alternation
  + * ?       repetition

Counted repetition like x{2,3} is reported as an error. Nothing here
backtracks, so there is no greedy-vs-lazy distinction either.

A leaf always consumes the longest prefix the pattern accepts, whatever the
order of alternatives. E.g. "a|ab" consumes "ab" out of "abc", not "a". This
differs from leftmost-first engines like Perl's or Python's. To prefer the
shorter match, use OneOf(Pattern("a"), Pattern("ab")) instead.
*/
#pragma once
#include <memory>
#include <string>

#include "runtime/diags.h"
#include "runtime/regex.h"

namespace ruler {

// Parses ctx.input() from position i to the end. On success, i is left at
// the end of input. Returns nullptr after pushing at least one error to
// ctx.diags. Warnings may be pushed even on success.
auto parseRegex(InputDiags& ctx, size_t& i) -> std::unique_ptr<const Regex>;

// Used for tests only. Dies on invalid input.
RegexCharSet parseRegexCharSet(std::string input);

}  // namespace ruler
