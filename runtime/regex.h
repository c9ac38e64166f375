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
#include <vector>

#include "input_view.h"

namespace ruler {

enum struct RegexNodeType {
  charSet, string, anchor, concat,
  repeat, optional, orList
};

class Regex {
 public:
  RegexNodeType nodeType;
  explicit Regex(RegexNodeType t) : nodeType(t) {}
  virtual ~Regex() {}
};

struct CharRange { unsigned char from, to; };

class RegexCharSet final : public Regex {
 public:
  RegexCharSet() : Regex(RegexNodeType::charSet) {}
  explicit RegexCharSet(std::vector<CharRange> r, bool neg = false)
    : Regex(RegexNodeType::charSet), ranges(std::move(r)), negated(neg) {}
  std::vector<CharRange> ranges;
  bool negated = false;
};

class RegexString final : public Regex {
 public:
  explicit RegexString(std::string v)
    : Regex(RegexNodeType::string), value(std::move(v)) {}
  std::string value;
};

class RegexAnchor final : public Regex {
 public:
  enum AnchorType { wordEdge, bol, eol } anchorType;
  explicit RegexAnchor(AnchorType t)
    : Regex(RegexNodeType::anchor), anchorType(t) {}
};

class RegexConcat final : public Regex {
 public:
  RegexConcat() : Regex(RegexNodeType::concat) {}
  explicit RegexConcat(std::vector<std::unique_ptr<const Regex>> parts)
    : Regex(RegexNodeType::concat), parts(std::move(parts)) {}
  std::vector<std::unique_ptr<const Regex>> parts;
};

// One or more repetitions. Zero or more is RegexOptional over RegexRepeat.
class RegexRepeat final : public Regex {
 public:
  explicit RegexRepeat(std::unique_ptr<const Regex> part)
    : Regex(RegexNodeType::repeat), part(std::move(part)) {}
  std::unique_ptr<const Regex> part;
};

class RegexOptional final : public Regex {
 public:
  explicit RegexOptional(std::unique_ptr<const Regex> part)
    : Regex(RegexNodeType::optional), part(std::move(part)) {}
  std::unique_ptr<const Regex> part;
};

class RegexOrList final : public Regex {
 public:
  RegexOrList() : Regex(RegexNodeType::orList) {}
  explicit RegexOrList(std::vector<std::unique_ptr<const Regex>> parts)
    : Regex(RegexNodeType::orList), parts(std::move(parts)) {}
  std::vector<std::unique_ptr<const Regex>> parts;
};

struct RegexOptions {
  RegexCharSet word;  // Used for \b matches.
};

// Word characters are [0-9A-Za-z_].
RegexOptions defaultRegexOptions();

bool matchesRegexCharSet(unsigned char ch, const RegexCharSet& cset);

// Tries to match regex starting at input[i]. On success, advances i past the
// longest prefix that matches and returns true. On failure, i is unchanged.
//
// Runs in time linear to the number of characters examined: no backtracking.
// Input before position i is not visible, so ^ and \b treat position i as if
// it followed a newline.
bool consumeGreedily(const InputPiece& input, size_t& i,
                     const Regex& regex, const RegexOptions& opts);

}  // namespace ruler
