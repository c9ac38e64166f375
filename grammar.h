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

#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "match.h"
#include "registry.h"
#include "rule.h"
#include "runtime/regex.h"

namespace ruler {

// A rule tree ready for matching. Typical usage:
//
//   GrammarBuilder gb;
//   RulePtr who = gb.define("who", OneOf("John", "Ann"));
//   Grammar g = gb.build(Seq(who, " likes tea"));
//   MatchResult res = g.match("Ann likes tea");
//   if(res) fmt::print("{}\n", *res.match->get("who"));
//   else fmt::print("{}\n", res.mismatch->render("Ann likes tea"));
//
// Construction throws TokenRedefinitionEx for ambiguous names. After that,
// a Grammar is immutable: any number of threads may call match() on it.
class Grammar {
 public:
  explicit Grammar(RulePtr root, RegexOptions opts = defaultRegexOptions());

  // Exactly one of the result's match or mismatch is set. The Match
  // declares the names the root flattens, see tokenRules().
  MatchResult match(std::string_view text) const;

  // Rules declaring the given top-level name, in declaration order.
  // Empty if the name is not declared.
  std::vector<const Rule*> tokenRules(std::string_view name) const;

  const Rule& root() const { return *root_; }

 private:
  std::shared_ptr<const Rule> root_;
  RegexOptions regexOpts_;
  std::unique_ptr<const TokenRegistry> tokens_;
};

// Collects (name, rule) bindings while a grammar is being put together, and
// only names the rules at build() time. This lets a rule be composed into
// others before it is named.
class GrammarBuilder {
 public:
  // Returns rule, unchanged.
  RulePtr define(std::string name, RulePtr rule);

  // Throws RuleNamingEx if some rule was already named differently.
  Grammar build(RulePtr root, RegexOptions opts = defaultRegexOptions()) const;

 private:
  std::vector<std::pair<std::string, RulePtr>> bindings_;
};

}  // namespace ruler
