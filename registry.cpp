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

#include "registry.h"
#include "rule.h"
#include "runtime/util.h"
using std::map;
using std::string;
using std::vector;

namespace ruler {

void ChildPlacement::place(const MatchPtr& child, TokenMap& slots) const {
  if(!ownName.empty()) {
    slots.at(ownName).at(offsets.at(ownName)) = child;
    return;
  }
  for(const auto& [name, offset] : offsets) {
    auto it = child->tokens().find(name);
    if(it == child->tokens().end())
      Bug("Match is missing the token '{}' promised by the registry", name);
    vector<MatchPtr>& dest = slots.at(name);
    for(size_t j=0; j<it->second.size(); ++j)
      dest.at(offset+j) = it->second[j];
  }
}

TokenMap RuleLayout::emptySlots() const {
  TokenMap rv;
  for(const auto& [name, rules] : declared)
    rv.emplace(name, vector<MatchPtr>(rules.size()));
  return rv;
}

TokenRegistry::TokenRegistry(const Rule& root) : root_(&root) {
  build(root);
}

const RuleLayout& TokenRegistry::layout(const Rule& rule) const {
  auto it = layouts_.find(&rule);
  if(it == layouts_.end())
    Bug("{} is not part of this grammar", describe(rule));
  return it->second;
}

// True if every declaration in a and b is the same rule. Repeating one rule
// in a ConcatRule gives a list, like OrRule siblings. Distinct rules sharing
// a name are still an error.
static bool sameDeclarer(const vector<const Rule*>& a,
                         const vector<const Rule*>& b) {
  const Rule* r = a.front();
  for(const Rule* x : a) if(x != r) return false;
  for(const Rule* x : b) if(x != r) return false;
  return true;
}

// Rules are shared between parents, so each one is visited only once. The
// rule graph is acyclic, so nothing here is ever seen half-built.
const RuleLayout& TokenRegistry::build(const Rule& rule) {
  if(auto it = layouts_.find(&rule); it != layouts_.end()) return it->second;

  RuleLayout rv;
  auto* comp = dynamic_cast<const CompoundRule*>(&rule);
  if(comp == nullptr) {
    if(dynamic_cast<const LeafRule*>(&rule) == nullptr)
      Unimplemented("Token registry for {}", rule.specifics_typename());
    return layouts_[&rule] = std::move(rv);
  }

  bool mergeAsList = dynamic_cast<const OrRule*>(&rule) != nullptr;
  for(const auto& child : comp->comps) {
    ChildPlacement placement;
    map<string, vector<const Rule*>> contrib;
    if(const string* name = child->nameOrNull()) {
      build(*child);  // Its own tokens only show up in its own Match.
      placement.ownName = *name;
      contrib[*name].push_back(child.get());
    }else {
      for(const auto& [name, rules] : build(*child).declared)
        contrib[name] = rules;
    }
    for(auto& [name, rules] : contrib) {
      vector<const Rule*>& dest = rv.declared[name];
      if(!dest.empty() && !mergeAsList && !sameDeclarer(dest, rules))
        TokenRedefinition("\"{}\" in {}", name, describe(rule));
      placement.offsets[name] = dest.size();
      dest.insert(dest.end(), rules.begin(), rules.end());
    }
    rv.placements.push_back(std::move(placement));
  }
  return layouts_[&rule] = std::move(rv);
}

}  // namespace ruler
