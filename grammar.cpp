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

#include "grammar.h"
#include <map>
#include "runtime/util.h"
using std::make_shared;
using std::make_unique;
using std::map;
using std::string;
using std::string_view;
using std::vector;

namespace ruler {

Grammar::Grammar(RulePtr root, RegexOptions opts)
  : root_(std::move(root)), regexOpts_(std::move(opts)) {
  if(!root_) UserError("Grammar needs a root rule");
  tokens_ = make_unique<const TokenRegistry>(*root_);
}

MatchResult Grammar::match(string_view text) const {
  MatchEnv env{tokens_.get(), &regexOpts_};
  MatchResult res = root_->match(env, text);
  if(res.skipped())
    return MatchResult::success(make_shared<const Match>(
             string(), tokens_->rootLayout().emptySlots()));
  return res;
}

vector<const Rule*> Grammar::tokenRules(string_view name) const {
  const auto& declared = tokens_->rootLayout().declared;
  auto it = declared.find(name);
  if(it == declared.end()) return {};
  return it->second;
}

RulePtr GrammarBuilder::define(string name, RulePtr rule) {
  if(!rule) UserError("Cannot define {} as a null rule", name);
  bindings_.emplace_back(std::move(name), rule);
  return rule;
}

// All bindings are checked before any rule is named, so a failed build leaves
// the rules unchanged.
Grammar GrammarBuilder::build(RulePtr root, RegexOptions opts) const {
  map<const Rule*, string_view> pending;
  for(const auto& [name, rule] : bindings_) {
    rule->checkName(name);
    auto [it, inserted] = pending.emplace(rule.get(), name);
    if(!inserted && it->second != name)
      RuleNamingError("Cannot name rule {} both {} and {}", describe(*rule),
                      it->second, name);
  }
  for(const auto& [name, rule] : bindings_) rule->deferred_name(name);
  return Grammar(std::move(root), std::move(opts));
}

}  // namespace ruler
