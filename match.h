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

// Values produced by a match attempt. None of these ever point back into
// the rules that produced them, so they can outlive the Grammar.
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "fmt/core.h"
#include "runtime/diags.h"

namespace ruler {

class Match;
using MatchPtr = std::shared_ptr<const Match>;

// Every name a rule declares maps to one slot per declaration, in declaration
// order. A slot is nullptr if the declaring rule did not take part in the
// match, e.g. it was on a losing alternation branch.
using TokenMap = std::map<std::string, std::vector<MatchPtr>, std::less<>>;

// What Match::get() returns. Unfortunately C++ does not have a convenient sum
// type with named alternatives, so this is spelled out by hand:
//
//   * absent: the name was declared once, but its rule did not take part in
//       the match. Also used for names that were never declared.
//   * single: the name was declared once, and it matched.
//   * list: the name was declared more than once. at(i) is the match for the
//       i-th declaration, or nullptr if that one did not fire.
class Token {
 public:
  enum Kind { absent, single, list };
  Token() = default;
  explicit Token(std::vector<MatchPtr> slots) : slots_(std::move(slots)) {}

  Kind kind() const;
  explicit operator bool() const { return kind() != absent; }

  // Only valid if kind() == single. Throws BugEx otherwise.
  const Match& operator*() const;
  const Match* operator->() const { return &**this; }

  // Number of declarations. Zero for undeclared names.
  size_t size() const { return slots_.size(); }
  const Match* at(size_t i) const;

 private:
  std::vector<MatchPtr> slots_;
};

class Match {
 public:
  Match(std::string text, TokenMap tokens)
    : text_(std::move(text)), tokens_(std::move(tokens)) {}

  // The exact text consumed, a prefix of what the rule was matched against.
  const std::string& text() const { return text_; }
  size_t size() const { return text_.size(); }

  Token get(std::string_view name) const;
  bool declares(std::string_view name) const;
  const TokenMap& tokens() const { return tokens_; }

  // Multi-line dump of the whole token tree, for debugging and test failures.
  // Not meant to be parsed.
  std::string prettyPrint(size_t indent = 0) const;

 private:
  std::string text_;
  TokenMap tokens_;
};

// Compares the consumed text. C++20 provides the reversed and != forms.
inline bool operator==(const Match& m, std::string_view s)
  { return m.text() == s; }

class Mismatch {
 public:
  Mismatch(size_t position, std::string description)
    : position_(position), description_(std::move(description)) {}

  // Always relative to the start of the text given to the outermost match().
  size_t position() const { return position_; }
  const std::string& description() const { return description_; }

  // Converts a position local to some remainder of the input into one
  // relative to a point `offset` characters earlier.
  Mismatch rebased(size_t offset) const;

  // Chooses the failures that got the furthest. If several of them tie,
  // their descriptions are merged, without duplicates, one per line.
  // Throws BugEx on an empty vector.
  static Mismatch furthest(const std::vector<Mismatch>& candidates);

  // Shows where things went wrong:
  //
  //   Mismatch at 3:
  //     abcef
  //        ^
  //   "ef" does not match "d"
  std::string render(std::string_view original) const;

  // Like Error(ctx, position, description), so multi-line inputs get proper
  // line and column numbers. The ctx.input should hold the original text.
  void report(InputDiags& ctx) const;

 private:
  size_t position_;
  std::string description_;
};

// Holds either a match or a mismatch. There is also a third, internal state:
// a skipped OptionalRule is successful but has no Match. Such rules do not
// consume any input, and their names are left absent in the parent.
// Grammar::match() never returns a skipped result.
struct MatchResult {
  MatchPtr match;
  std::optional<Mismatch> mismatch;

  explicit operator bool() const { return !mismatch.has_value(); }
  bool skipped() const { return !match && !mismatch; }

  static MatchResult success(MatchPtr m);
  static MatchResult skip() { return {}; }
  static MatchResult failure(Mismatch mm);
};

}  // namespace ruler

// Formats as the consumed text. Use Match::prettyPrint() to see the tokens.
template <> struct fmt::formatter<ruler::Match>
  : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const ruler::Match& m, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(m.text(), ctx);
  }
};
