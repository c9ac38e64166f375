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

// Unit tests for the code here are outside the runtime/ folder, in
// regex_io_test.cpp, since they use pattern parsing functions.
#include "regex.h"
#include "util.h"
using std::string;
using std::unique_ptr;
using std::vector;

namespace ruler {

namespace {

// Simulation state for one node of a Regex tree, shaped like the tree.
//
//   * charSet, string, anchor: live[k] is true if some path through the
//     pattern has consumed exactly k characters of this node. Its size is
//     one more than the node's length.
//   * optional: justStarted, plus a single entry in parts.
//   * concat, orList: one entry in parts per Regex part.
//   * repeat: shares the state of its part, so it doesn't use its own.
//
// All paths are tracked simultaneously, which is what makes the match
// non-backtracking.
struct NodeState {
  vector<bool> live;
  bool justStarted = false;
  vector<NodeState> parts;
};

enum AnchorMatches { matchesWordEdge = 1, matchesBol = 2, matchesEol = 4 };

const RegexString& asString(const Regex& r)
  { return static_cast<const RegexString&>(r); }
const RegexCharSet& asCharSet(const Regex& r)
  { return static_cast<const RegexCharSet&>(r); }
const RegexAnchor& asAnchor(const Regex& r)
  { return static_cast<const RegexAnchor&>(r); }
const RegexConcat& asConcat(const Regex& r)
  { return static_cast<const RegexConcat&>(r); }
const RegexOrList& asOrList(const Regex& r)
  { return static_cast<const RegexOrList&>(r); }
const RegexRepeat& asRepeat(const Regex& r)
  { return static_cast<const RegexRepeat&>(r); }
const RegexOptional& asOptional(const Regex& r)
  { return static_cast<const RegexOptional&>(r); }

NodeState init(const Regex& regex);

vector<NodeState> initParts(const vector<unique_ptr<const Regex>>& parts) {
  vector<NodeState> rv;
  for(auto& part : parts) rv.push_back(init(*part));
  return rv;
}

NodeState init(const Regex& regex) {
  NodeState rv;
  switch(regex.nodeType) {
    case RegexNodeType::charSet:
    case RegexNodeType::anchor:
      rv.live.assign(2, false);
      return rv;
    case RegexNodeType::string:
      rv.live.assign(asString(regex).value.size()+1, false);
      return rv;
    case RegexNodeType::optional:
      rv.parts.push_back(init(*asOptional(regex).part));
      return rv;
    case RegexNodeType::orList:
      rv.parts = initParts(asOrList(regex).parts);
      return rv;
    case RegexNodeType::concat:
      rv.parts = initParts(asConcat(regex).parts);
      return rv;
    case RegexNodeType::repeat:
      return init(*asRepeat(regex).part);
    default:
      Unimplemented("init() for RegexNodeType {}", int(regex.nodeType));
  }
}

void checkParts(const NodeState& state, size_t sz) {
  if(state.parts.size() != sz)
    Bug("init() produced states with the wrong size: {} != {}",
        sz, state.parts.size());
}

bool any(const vector<bool>& v) {
  for(bool b : v) if(b) return true;
  return false;
}

bool matched(const Regex& regex, const NodeState& state);

void start(const Regex& regex, NodeState& state) {
  switch(regex.nodeType) {
    case RegexNodeType::charSet:
    case RegexNodeType::string:
    case RegexNodeType::anchor:
      state.live.at(0) = true;
      break;
    case RegexNodeType::optional:
      state.justStarted = true;
      start(*asOptional(regex).part, state.parts.at(0));
      break;
    case RegexNodeType::orList: {
      auto& ors = asOrList(regex);
      checkParts(state, ors.parts.size());
      for(size_t i=0; i<ors.parts.size(); ++i)
        start(*ors.parts[i], state.parts[i]);
      break;
    }
    case RegexNodeType::repeat:
      start(*asRepeat(regex).part, state);
      break;
    case RegexNodeType::concat: {
      auto& seq = asConcat(regex);
      if(seq.parts.empty())
        Bug("Cannot Concat over an empty vector. "
            "Use an empty string instead.");
      checkParts(state, seq.parts.size());
      start(*seq.parts[0], state.parts[0]);
      for(size_t i=1; i<seq.parts.size(); ++i) {
        if(!matched(*seq.parts[i-1], state.parts[i-1])) break;
        start(*seq.parts[i], state.parts[i]);
      }
      break;
    }
    default: Bug("Unknown node type in start() {}", int(regex.nodeType));
  }
}

bool matched(const Regex& regex, const NodeState& state) {
  switch(regex.nodeType) {
    case RegexNodeType::charSet:
    case RegexNodeType::string:
    case RegexNodeType::anchor:
      return state.live.back();
    case RegexNodeType::optional:
      return state.justStarted ||
             matched(*asOptional(regex).part, state.parts.at(0));
    case RegexNodeType::orList: {
      auto& ors = asOrList(regex);
      for(size_t i=0; i<ors.parts.size(); ++i)
        if(matched(*ors.parts[i], state.parts.at(i))) return true;
      return false;
    }
    case RegexNodeType::repeat:
      return matched(*asRepeat(regex).part, state);
    case RegexNodeType::concat:
      return matched(*asConcat(regex).parts.back(), state.parts.back());
    default: Bug("Unknown node type in matched() {}", int(regex.nodeType));
  }
}

bool mightMatch(const Regex& regex, const NodeState& state) {
  switch(regex.nodeType) {
    case RegexNodeType::charSet:
    case RegexNodeType::string:
    case RegexNodeType::anchor:
      return any(state.live);
    case RegexNodeType::optional:
      return state.justStarted ||
             mightMatch(*asOptional(regex).part, state.parts.at(0));
    case RegexNodeType::repeat:
      return mightMatch(*asRepeat(regex).part, state);
    case RegexNodeType::orList:
    case RegexNodeType::concat: {
      auto& parts = regex.nodeType == RegexNodeType::orList
                  ? asOrList(regex).parts : asConcat(regex).parts;
      for(size_t i=0; i<parts.size(); ++i)
        if(mightMatch(*parts[i], state.parts.at(i))) return true;
      return false;
    }
    default: Bug("Unknown node type in mightMatch() {}", int(regex.nodeType));
  }
}

// Every live path moves one character forward.
void shiftRight(vector<bool>& v) {
  v.pop_back();
  v.insert(v.begin(), false);
}

void advance(const Regex& regex, unsigned char ch, NodeState& state) {
  switch(regex.nodeType) {
    case RegexNodeType::charSet:
      if(!matchesRegexCharSet(ch, asCharSet(regex))) state.live.at(0) = false;
      shiftRight(state.live);
      break;
    case RegexNodeType::string: {
      const string& s = asString(regex).value;
      for(size_t i=0; i<s.size(); ++i)
        if(ch != static_cast<unsigned char>(s[i])) state.live[i] = false;
      shiftRight(state.live);
      break;
    }
    case RegexNodeType::anchor:
      state.live.assign(2, false);
      break;
    case RegexNodeType::optional:
      state.justStarted = false;
      advance(*asOptional(regex).part, ch, state.parts.at(0));
      break;
    case RegexNodeType::orList: {
      auto& ors = asOrList(regex);
      checkParts(state, ors.parts.size());
      for(size_t i=0; i<ors.parts.size(); ++i)
        advance(*ors.parts[i], ch, state.parts[i]);
      break;
    }
    case RegexNodeType::repeat: {
      const Regex& part = *asRepeat(regex).part;
      advance(part, ch, state);
      if(matched(part, state)) start(part, state);
      break;
    }
    case RegexNodeType::concat: {
      auto& seq = asConcat(regex);
      checkParts(state, seq.parts.size());
      for(size_t i=0; i<seq.parts.size(); ++i)
        advance(*seq.parts[i], ch, state.parts[i]);
      for(size_t i=0; i+1<seq.parts.size(); ++i)
        if(matched(*seq.parts[i], state.parts[i]))
          start(*seq.parts[i+1], state.parts[i+1]);
      break;
    }
    default: Bug("Unknown node type in advance() {}", int(regex.nodeType));
  }
}

AnchorMatches anchorBetweenChars(char from, char to, const RegexOptions& opts) {
  bool w1 = matchesRegexCharSet(from, opts.word);
  bool w2 = matchesRegexCharSet(to, opts.word);
  int rv = 0;
  if(w1 != w2) rv |= matchesWordEdge;
  if(from == '\n') rv |= matchesBol;
  if(to == '\n') rv |= matchesEol;
  return static_cast<AnchorMatches>(rv);
}

bool anchorHolds(RegexAnchor::AnchorType a, AnchorMatches anch) {
  return ((anch & matchesWordEdge) && a == RegexAnchor::wordEdge) ||
         ((anch & matchesBol) && a == RegexAnchor::bol) ||
         ((anch & matchesEol) && a == RegexAnchor::eol);
}

// Zero-width step between two characters. Only ever adds more true values to
// the state, never takes them away.
void advanceAnchor(const Regex& regex, NodeState& state, AnchorMatches anch) {
  switch(regex.nodeType) {
    case RegexNodeType::charSet:
    case RegexNodeType::string:
      break;
    case RegexNodeType::anchor:
      if(state.live.at(0) && anchorHolds(asAnchor(regex).anchorType, anch))
        state.live.at(1) = true;
      break;
    case RegexNodeType::optional:
      advanceAnchor(*asOptional(regex).part, state.parts.at(0), anch);
      break;
    case RegexNodeType::orList: {
      auto& ors = asOrList(regex);
      checkParts(state, ors.parts.size());
      for(size_t i=0; i<ors.parts.size(); ++i)
        advanceAnchor(*ors.parts[i], state.parts[i], anch);
      break;
    }
    case RegexNodeType::repeat: {
      const Regex& part = *asRepeat(regex).part;
      bool startedMatched = matched(part, state);
      advanceAnchor(part, state, anch);
      // Fixpoint guaranteed in a single additional iteration.
      if(!startedMatched && matched(part, state)) {
        start(part, state);
        advanceAnchor(part, state, anch);
      }
      break;
    }
    case RegexNodeType::concat: {
      auto& seq = asConcat(regex);
      size_t n = seq.parts.size();
      if(n == 0) return;
      checkParts(state, n);
      for(size_t i=0; i+1<n; i++) {
        const Regex& p = *seq.parts[i];
        bool startedMatched = matched(p, state.parts[i]);
        advanceAnchor(p, state.parts[i], anch);
        if(!startedMatched && matched(p, state.parts[i]))
          start(*seq.parts[i+1], state.parts[i+1]);
      }
      advanceAnchor(*seq.parts[n-1], state.parts[n-1], anch);
      break;
    }
    default:
      Bug("Unknown node type in advanceAnchor() {}", int(regex.nodeType));
  }
}

}  // namespace

RegexOptions defaultRegexOptions() {
  return RegexOptions{
    .word = RegexCharSet({{'0','9'}, {'A','Z'}, {'a','z'}, {'_','_'}}),
  };
}

bool matchesRegexCharSet(unsigned char ch, const RegexCharSet& cset) {
  for(auto& range : cset.ranges)
    if(range.from <= ch && ch <= range.to) return !cset.negated;
  return cset.negated;
}

bool consumeGreedily(const InputPiece& input, size_t& i, const Regex& regex,
                     const RegexOptions& opts) {
  NodeState state = init(regex);
  char prev = '\n';
  start(regex, state);
  size_t j = i;
  size_t last_matched = string::npos;

  // Important invariants:
  //   matched() implies mightMatch()
  //   advanceAnchor() never makes matched() or mightMatch() become false.
  //   advance() can potentially make mightMatch() turn from true to false,
  //     never the other way around.
  while(mightMatch(regex, state) && input.sizeGt(j)) {
    advanceAnchor(regex, state, anchorBetweenChars(prev, input[j], opts));
    if(matched(regex, state)) last_matched = j;
    advance(regex, input[j], state);
    prev = input[j++];
  }
  if(!input.sizeGt(j)) {
    advanceAnchor(regex, state, anchorBetweenChars(prev, '\n', opts));
    if(matched(regex, state)) last_matched = j;
  }
  if(last_matched != string::npos) { i = last_matched; return true; }
  else return false;
}

}  // namespace ruler
