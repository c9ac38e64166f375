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
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include "match.h"

namespace ruler {

class Rule;

// Says where the tokens of one component go in its parent's TokenMap.
struct ChildPlacement {
  // Empty if the component is unnamed, and its own tokens are flattened
  // into the parent.
  std::string ownName;

  // For each name the component contributes, the index of its first slot in
  // the parent. A named component contributes exactly one slot, for ownName.
  // An unnamed one contributes all of its declared slots, contiguously.
  std::map<std::string, size_t> offsets;

  // Copies child, or its tokens, into parent slots.
  void place(const MatchPtr& child, TokenMap& slots) const;
};

// Names exposed by a rule in a particular grammar.
struct RuleLayout {
  // Each name, with the rules declaring it in declaration order. For
  // ConcatRule and OptionalRule, these lists can have more than one element
  // only if they came from a flattened OrRule, or if a single rule is
  // repeated.
  std::map<std::string, std::vector<const Rule*>, std::less<>> declared;

  // One per component. Always empty for LeafRule.
  std::vector<ChildPlacement> placements;

  // A TokenMap with the right number of slots, all nullptr.
  TokenMap emptySlots() const;
};

// Computed once when a Grammar is constructed, for every rule reachable from
// the root. It never changes afterwards, so it can be used concurrently.
//
// Throws TokenRedefinitionEx if two components of a ConcatRule or an
// OptionalRule expose the same name from different rules, after flattening.
// OrRule components are mutually exclusive, so their names are merged into
// lists instead. So are repeats of the same rule, e.g. Seq(a, ",", a).
class TokenRegistry {
 public:
  explicit TokenRegistry(const Rule& root);
  TokenRegistry(const TokenRegistry&) = delete;
  TokenRegistry& operator=(const TokenRegistry&) = delete;

  // Throws BugEx if rule is not reachable from the root.
  const RuleLayout& layout(const Rule& rule) const;

  // Names exposed by a rule to its parent, if the rule itself is unnamed.
  // For the root rule, these are the names a Match from Grammar::match()
  // declares.
  const RuleLayout& rootLayout() const { return layout(*root_); }

 private:
  const Rule* root_;
  std::unordered_map<const Rule*, RuleLayout> layouts_;
  const RuleLayout& build(const Rule& rule);
};

}  // namespace ruler
