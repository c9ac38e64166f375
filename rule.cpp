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

#include "rule.h"
#include <cctype>
#include "fmt/format.h"
#include "regex_io.h"
#include "registry.h"
#include "runtime/diags.h"
#include "runtime/input_view.h"
using fmt::format;
using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::string;
using std::string_view;
using std::vector;

namespace ruler {

void
Rule::checkName(string_view name) const {
  if(name.empty())
    RuleNamingError("Cannot give rule {} an empty name",
                    name_.empty() ? describe(*this) : name_);
  if(!name_.empty() && name_ != name)
    RuleNamingError("Cannot rename rule {} to {}", name_, name);
  checkTokenName(name);
}

void
Rule::deferred_name(string name) {
  checkName(name);
  name_ = std::move(name);
}

// Names must also be valid C identifiers, minus the ones with leading,
// trailing, or doubled underscores.
void checkTokenName(string_view name) {
  bool hasAlnum = false;
  for(char ch : name) {
    if(isalnum(static_cast<unsigned char>(ch))) hasAlnum = true;
    else if(ch != '_')
      UserError("Invalid character '{}' in token name \"{}\"", ch, name);
  }
  if(!hasAlnum)
    UserError("Token name \"{}\" must have a digit or letter", name);
  if(name.front() == '_' || name.back() == '_')
    UserError("Token name \"{}\" has a leading or trailing underscore", name);
  if(isdigit(static_cast<unsigned char>(name.front())))
    UserError("Token name \"{}\" starts with a digit", name);
  if(isSubstr("__", name))
    UserError("Token name \"{}\" has consecutive underscores", name);
}

MatchResult
LeafRule::match(const MatchEnv& env, string_view text) const {
  InputView input{text};
  size_t i = 0;
  if(consumeGreedily(input, i, *regex, *env.regexOpts))
    return MatchResult::success(
        make_shared<const Match>(string(text.substr(0, i)), TokenMap{}));
  if(text.empty())
    return MatchResult::failure(Mismatch(0,
             format("reached end of input but expected \"{}\"", source)));
  else return MatchResult::failure(Mismatch(0,
                format("\"{}\" does not match \"{}\"", text, source)));
}

static const RuleLayout&
compoundLayout(const MatchEnv& env, const CompoundRule& rule) {
  const RuleLayout& layout = env.tokens->layout(rule);
  if(layout.placements.size() != rule.comps.size())
    Bug("{} has {} components, but the grammar placed {}", describe(rule),
        rule.comps.size(), layout.placements.size());
  return layout;
}

// Shared by ConcatRule and OptionalRule.
static MatchResult
matchConcat(const MatchEnv& env, const CompoundRule& rule, string_view text) {
  const RuleLayout& layout = compoundLayout(env, rule);
  TokenMap slots = layout.emptySlots();
  size_t pos = 0;
  for(size_t i=0; i<rule.comps.size(); ++i) {
    MatchResult res = rule.comps[i]->match(env, text.substr(pos));
    if(!res) return MatchResult::failure(res.mismatch->rebased(pos));
    if(res.skipped()) continue;
    layout.placements[i].place(res.match, slots);
    pos += res.match->size();
  }
  return MatchResult::success(
      make_shared<const Match>(string(text.substr(0, pos)), std::move(slots)));
}

MatchResult
ConcatRule::match(const MatchEnv& env, string_view text) const {
  return matchConcat(env, *this, text);
}

MatchResult
OrRule::match(const MatchEnv& env, string_view text) const {
  vector<Mismatch> failures;
  for(size_t i=0; i<comps.size(); ++i) {
    MatchResult res = comps[i]->match(env, text);
    if(!res) {
      failures.push_back(std::move(*res.mismatch));
      continue;
    }
    const RuleLayout& layout = compoundLayout(env, *this);
    TokenMap slots = layout.emptySlots();
    if(res.skipped())
      return MatchResult::success(
          make_shared<const Match>(string(), std::move(slots)));
    layout.placements[i].place(res.match, slots);
    return MatchResult::success(
        make_shared<const Match>(res.match->text(), std::move(slots)));
  }
  return MatchResult::failure(Mismatch::furthest(failures));
}

MatchResult
OptionalRule::match(const MatchEnv& env, string_view text) const {
  MatchResult res = matchConcat(env, *this, text);
  if(!res) return MatchResult::skip();
  else return res;
}

string describe(const Rule& rule) {
  if(const string* name = rule.nameOrNull()) return *name;
  if(auto* leaf = dynamic_cast<const LeafRule*>(&rule))
    return format("\"{}\"", leaf->source);
  if(auto* comp = dynamic_cast<const CompoundRule*>(&rule)) {
    string rv = comp->specifics_typename() + "(";
    for(size_t i=0; i<comp->comps.size(); ++i) {
      if(i) rv += ", ";
      rv += describe(*comp->comps[i]);
    }
    return rv + ")";
  }
  return rule.specifics_typename();
}

RuleArg::RuleArg(const char* s) : rule_(Literal(s)) {}
RuleArg::RuleArg(string s) : rule_(Literal(std::move(s))) {}

RulePtr Literal(string s) {
  auto regex = make_unique<RegexString>(s);
  return make_shared<LeafRule>(std::move(s), std::move(regex));
}

RulePtr Pattern(string p) {
  InputDiags ctx{Input{p}};
  size_t i = 0;
  auto regex = parseRegex(ctx, i);
  if(!regex) {
    for(const auto& d : ctx.diags) if(d.severity == Diag::error)
      UserError("Invalid pattern \"{}\": {}", p, string(d));
    Bug("parseRegex() failed without an error for \"{}\"", p);
  }
  return make_shared<LeafRule>(std::move(p), std::move(regex));
}

static vector<shared_ptr<const Rule>> releaseAll(vector<RuleArg> args) {
  vector<shared_ptr<const Rule>> rv;
  for(auto& arg : args) {
    RulePtr r = std::move(arg).release();
    if(!r) UserError("Rule components cannot be null");
    rv.push_back(std::move(r));
  }
  return rv;
}

RulePtr makeConcat(vector<RuleArg> args) {
  return make_shared<ConcatRule>(releaseAll(std::move(args)));
}

RulePtr makeOr(vector<RuleArg> args) {
  if(args.empty()) UserError("OneOf() needs at least one alternative");
  return make_shared<OrRule>(releaseAll(std::move(args)));
}

RulePtr makeOptional(vector<RuleArg> args) {
  return make_shared<OptionalRule>(releaseAll(std::move(args)));
}

RulePtr named(string name, RulePtr rule) {
  if(!rule) UserError("Cannot name a null rule {}", name);
  rule->deferred_name(std::move(name));
  return rule;
}

}  // namespace ruler
