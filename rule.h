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
#include <vector>
#include "match.h"
#include "runtime/regex.h"
#include "runtime/util.h"

namespace ruler {

// Forward decl.
class TokenRegistry;
class Rule;

using RulePtr = std::shared_ptr<Rule>;

// Everything a rule needs from its Grammar during a match. Both pointers are
// non-null, and outlive the match() call.
struct MatchEnv {
  const TokenRegistry* tokens;
  const RegexOptions* regexOpts;
};

/*
Rules form a DAG: the same rule may appear under several parents, and in
several grammars. Matching never modifies a rule. Per-grammar information,
like which names a rule exposes, lives in the TokenRegistry instead.

  * LeafRule: a literal or a regex, matched at the start of the input.
  * ConcatRule: components matched back-to-back.
  * OrRule: the first component that matches, in declaration order.
  * OptionalRule: components matched back-to-back, or nothing at all.

A rule's name is what its parent uses to refer to its match. Unnamed compound
rules have their components' names flattened into their parent instead.
*/

// Dev-note: Keep this class abstract, so the registry can dispatch with
// dynamic_cast without having to special-case a bare Rule.
class Rule {
 public:
  Rule() {}
  virtual ~Rule() {}

  const std::string* nameOrNull() const {
    if(name_.empty()) return nullptr; else return &name_;
  }

  // A rule may be named only once. Naming it again with the same name is
  // allowed, and does nothing. Anything else throws RuleNamingEx.
  void deferred_name(std::string name);

  // Throws whatever deferred_name(name) would, without naming anything.
  void checkName(std::string_view name) const;

  // Used for debugging/logging.
  virtual std::string specifics_typename() const = 0;

  // Matches a prefix of text. Failure positions are relative to the start of
  // text, and need to be rebased by the caller.
  virtual MatchResult match(const MatchEnv& env,
                            std::string_view text) const = 0;

 private:
  std::string name_;
};

class LeafRule final : public Rule {
 public:
  // source is only used in mismatch descriptions.
  LeafRule(std::string source, std::unique_ptr<const Regex> regex)
    : source(std::move(source)), regex(std::move(regex)) {}
  std::string specifics_typename() const override { return "LeafRule"; }
  MatchResult match(const MatchEnv& env, std::string_view text) const override;
  const std::string source;
  const std::unique_ptr<const Regex> regex;
};

// Base class for rules that have components. The components are fixed at
// construction, since a Grammar's TokenRegistry has one placement per
// component.
class CompoundRule : public Rule {
 public:
  explicit CompoundRule(std::vector<std::shared_ptr<const Rule>> c)
    : comps(std::move(c)) {}
  const std::vector<std::shared_ptr<const Rule>> comps;
};

class ConcatRule final : public CompoundRule {
 public:
  using CompoundRule::CompoundRule;
  std::string specifics_typename() const override { return "ConcatRule"; }
  MatchResult match(const MatchEnv& env, std::string_view text) const override;
};

// Tries comps in order, and picks the first one that matches. It does not
// look for the longest match. If none matches, it reports the mismatches that
// got the furthest.
class OrRule final : public CompoundRule {
 public:
  using CompoundRule::CompoundRule;
  std::string specifics_typename() const override { return "OrRule"; }
  MatchResult match(const MatchEnv& env, std::string_view text) const override;
};

// Never fails. If the comps do not all match, the result is skipped.
class OptionalRule final : public CompoundRule {
 public:
  using CompoundRule::CompoundRule;
  std::string specifics_typename() const override { return "OptionalRule"; }
  MatchResult match(const MatchEnv& env, std::string_view text) const override;
};

// Short description for error messages, e.g. ConcatRule("a", who, "b").
std::string describe(const Rule& rule);

// Throws UserErrorEx if name is not a valid token name.
void checkTokenName(std::string_view name);

// Arguments for the factories below. Plain strings become literals.
class RuleArg {
 public:
  RuleArg(const char* s);
  RuleArg(std::string s);
  RuleArg(RulePtr r) : rule_(std::move(r)) {}
  RulePtr release() && { return std::move(rule_); }
 private:
  RulePtr rule_;
};

// Matches exactly s. Literal("") always matches, consuming nothing.
RulePtr Literal(std::string s);

// Throws UserErrorEx on an invalid pattern. See regex_io.h for the syntax.
RulePtr Pattern(std::string p);

RulePtr makeConcat(std::vector<RuleArg> args);
RulePtr makeOr(std::vector<RuleArg> args);
RulePtr makeOptional(std::vector<RuleArg> args);

template <class ... Args> RulePtr Seq(Args ... args) {
  return makeConcat(makeVector<RuleArg>(std::move(args)...));
}

// Needs at least one alternative.
template <class ... Args> RulePtr OneOf(Args ... args) {
  return makeOr(makeVector<RuleArg>(std::move(args)...));
}

template <class ... Args> RulePtr Opt(Args ... args) {
  return makeOptional(makeVector<RuleArg>(std::move(args)...));
}

// Names a rule, and returns it. E.g. named("who", OneOf("John", "Ann")).
RulePtr named(std::string name, RulePtr rule);

}  // namespace ruler
