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

#include "match.h"
#include <algorithm>
#include <iterator>
#include <set>
#include "fmt/format.h"
#include "runtime/util.h"
using fmt::format;
using fmt::format_to;
using std::set;
using std::string;
using std::string_view;
using std::vector;

namespace ruler {

auto Token::kind() const -> Kind {
  if(slots_.size() > 1) return list;
  else if(slots_.size() == 1 && slots_[0]) return single;
  else return absent;
}

const Match& Token::operator*() const {
  if(kind() != single)
    Bug("Dereferencing a token of kind {}. Use at() for lists.", int(kind()));
  return *slots_[0];
}

const Match* Token::at(size_t i) const {
  if(i >= slots_.size())
    Bug("Token index {} is out of range. It only has {} declarations.",
        i, slots_.size());
  return slots_[i].get();
}

Token Match::get(string_view name) const {
  auto it = tokens_.find(name);
  if(it == tokens_.end()) return Token{};
  return Token{it->second};
}

bool Match::declares(string_view name) const {
  return tokens_.find(name) != tokens_.end();
}

static void prettyPrintRec(fmt::memory_buffer& buf, const Match& m,
                           size_t indent) {
  auto out = std::back_inserter(buf);
  format_to(out, "\"{}\"", m.text());
  for(const auto& [name, slots] : m.tokens()) {
    for(size_t i=0; i<slots.size(); ++i) {
      format_to(out, "\n{:{}}{}", "", indent+2, name);
      if(slots.size() > 1) format_to(out, "[{}]", i);
      format_to(out, ": ");
      if(slots[i]) prettyPrintRec(buf, *slots[i], indent+2);
      else format_to(out, "(absent)");
    }
  }
}

string Match::prettyPrint(size_t indent) const {
  fmt::memory_buffer buf;
  prettyPrintRec(buf, *this, indent);
  return fmt::to_string(buf);
}

Mismatch Mismatch::rebased(size_t offset) const {
  return Mismatch(position_ + offset, description_);
}

Mismatch Mismatch::furthest(const vector<Mismatch>& candidates) {
  if(candidates.empty()) Bug("Mismatch::furthest() needs some candidates");
  size_t pos = 0;
  for(const auto& mm : candidates) pos = std::max(pos, mm.position());
  set<string> descs;
  for(const auto& mm : candidates)
    if(mm.position() == pos) descs.insert(mm.description());
  string desc;
  for(const auto& d : descs) {
    if(!desc.empty()) desc += '\n';
    desc += d;
  }
  return Mismatch(pos, std::move(desc));
}

string Mismatch::render(string_view original) const {
  return format("Mismatch at {}:\n  {}\n  {:{}}^\n{}",
                position_, original, "", position_, description_);
}

void Mismatch::report(InputDiags& ctx) const {
  Error(ctx, position_, position_+1, description_);
}

MatchResult MatchResult::success(MatchPtr m) {
  if(!m) Bug("MatchResult::success() needs a match");
  return MatchResult{std::move(m), std::nullopt};
}

MatchResult MatchResult::failure(Mismatch mm) {
  return MatchResult{nullptr, std::move(mm)};
}

}  // namespace ruler
