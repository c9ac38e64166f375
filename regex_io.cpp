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

#include "regex_io.h"
#include <cctype>
#include <optional>
#include <vector>
#include "runtime/util.h"
using std::make_unique;
using std::nullopt;
using std::optional;
using std::string;
using std::unique_ptr;
using std::vector;

namespace ruler {

namespace {

constexpr uint8_t kMaxDepth = 255;
constexpr uint8_t kMaxRepDepth = 5;
const char stringMeta[] = "\\/.[]{}()^$|+*?-";
const char setMeta[] = "^\\-]";

auto parseRec(InputDiags& ctx, size_t& i, uint8_t depth)
  -> unique_ptr<const Regex>;

bool hasChar(const InputPiece& input, size_t pos, char ch) {
  return input.sizeGt(pos) && input[pos]==ch;
}

bool isPrintable(char ch) {
  return std::isprint(static_cast<unsigned char>(ch));
}

// This allows us to not handle some corner cases, e.g. "[--x]".
bool isPlainRange(unsigned char from, unsigned char to) {
  return (isdigit(from) && isdigit(to)) ||
         (isupper(from) && isupper(to)) ||
         (islower(from) && islower(to));
}

// Ranges for \d, \w, and \s. Returns an empty vector for anything else.
vector<CharRange> classRanges(char code) {
  switch(code) {
    case 'd': return {{'0','9'}};
    case 'w': return {{'0','9'}, {'A','Z'}, {'a','z'}, {'_','_'}};
    case 's': return {{' ',' '}, {'\t','\r'}};
    default: return {};
  }
}

bool isClassCode(char ch) { return is_in(ch, "dwsDWS"); }

auto unescaped(char ch, const char meta[]) -> optional<unsigned char> {
  if(ch == 't') return '\t';
  else if(ch == 'n') return '\n';
  else if(ch == 'r') return '\r';
  else if(is_in(ch, meta)) return ch;
  else return nullopt;
}

optional<uint8_t> hexValue(char ch) {
  if(isdigit(static_cast<unsigned char>(ch))) return ch-'0';
  if('a' <= ch && ch <= 'f') return ch-'a'+10;
  if('A' <= ch && ch <= 'F') return ch-'A'+10;
  return nullopt;
}

// Assumes caller has already checked for "\x" prefix.
auto parseHexCode(InputDiags& ctx, size_t& i) -> optional<unsigned char> {
  const InputPiece& input = ctx.input;
  optional<uint8_t> hi, lo;
  if(input.sizeGt(i+3)) {
    hi = hexValue(input[i+2]);
    lo = hexValue(input[i+3]);
  }
  if(!hi || !lo) return Error(ctx, i, i+4, "Invalid hex code");
  i += 4;
  return *hi*16 + *lo;
}

auto parseEscapeCode(InputDiags& ctx, size_t& i, const char meta[]) ->
optional<unsigned char> {
  const InputPiece& input = ctx.input;
  if(!hasChar(input,i,'\\')) return nullopt;
  if(!input.sizeGt(i+1)) return Error(ctx, i, i+1, "Incomplete escape code");
  if(input[i+1] == 'x') return parseHexCode(ctx, i);
  if(auto res = unescaped(input[i+1], meta)) { i=i+2; return res; }
  else return Error(ctx, i, i+2, "Unknown escape code");
}

auto parseCharSetElt(InputDiags& ctx, size_t& i) -> optional<unsigned char> {
  const InputPiece& input = ctx.input;
  if(!input.sizeGt(i)) return nullopt;
  if(input[i] == '\\') return parseEscapeCode(ctx, i, setMeta);
  char ch = input[i];
  if(!isPrintable(ch)) return Error(ctx, i, i+1, "Invalid character");
  ++i;
  return ch;
}

auto parseCharSetUnq(InputDiags& ctx, size_t& i) -> unique_ptr<RegexCharSet> {
  const InputPiece& input = ctx.input;
  if(!hasChar(input,i,'['))
    Bug("parseCharSetUnq called at invalid location {}", i);
  RegexCharSet cset;
  size_t j = i+1;

  if(hasChar(input,j,'^')) { cset.negated = true; ++j; }

  // One or more set elements, not zero or more.
  // Allow ']' as the first set element. It does not close the set.
  do {
    if(!input.sizeGt(j)) {
      Error(ctx, i, i+1, "Unmatched '['");
      i = j;
      return nullptr;
    }
    if(hasChar(input,j,'\\') && input.sizeGt(j+1) &&
       !classRanges(input[j+1]).empty()) {
      for(auto& r : classRanges(input[j+1])) cset.ranges.push_back(r);
      j += 2;
      continue;
    }
    if(auto st = parseCharSetElt(ctx, j)) cset.ranges.push_back({*st,*st});
    else { ++j; continue; }

    // We have more to do if we are starting a range.
    if(!hasChar(input,j,'-')) continue;

    // Treat the '-' literally if this is the last character.
    if(hasChar(input,j+1,']')) continue;
    ++j;

    // Parse out the end character.
    auto& new_range = cset.ranges.back();
    if(auto en = parseCharSetElt(ctx, j)) new_range.to = *en;
    else { ++j; continue; }

    if(new_range.from == new_range.to)
      Warning(ctx, i, j, "Redundant range. Use a single character.");
    else if(new_range.from > new_range.to)
      Error(ctx, i, j, "Invalid range going backwards.");
    else if(!isPlainRange(new_range.from, new_range.to))
      Error(ctx, i, j, "Ranges can only span 0-9, A-Z, or a-z.");

    if(hasChar(input,j,'-') && !hasChar(input,j+1,']'))
      Error(ctx, j, j+1, "Character range has no start");
  } while(!hasChar(input,j,']'));
  i = j+1;
  return move_to_unique(cset);
}

auto parseGroup(InputDiags& ctx, size_t& i, uint8_t depth)
  -> unique_ptr<const Regex> {
  if(depth == kMaxDepth) {
    Error(ctx, i, i+1, "Parentheses nested too deep");
    return nullptr;
  }
  const InputPiece& input = ctx.input;
  size_t j = i;
  if(!hasChar(input,i,'(')) Bug("parseGroup() must start with '('");
  unique_ptr<const Regex> res = parseRec(ctx, ++j, depth+1);
  if(!res) return nullptr;
  if(!hasChar(input,j,')')) {
    Error(ctx, i, j, "Unmatched '('");
    return nullptr;
  }
  i = j+1;
  return res;
}

bool startsRepeat(char ch) { return is_in(ch, "+*?{"); }

auto parseSingleChar(InputDiags& ctx, size_t& i) -> unique_ptr<const Regex> {
  auto reta = [&i](RegexAnchor::AnchorType a, size_t off) {
    i += off;
    return make_unique<RegexAnchor>(a);
  };
  const InputPiece& input = ctx.input;
  char ch = input[i];
  if(ch == '\\') {
    if(hasChar(input,i+1,'b')) return reta(RegexAnchor::wordEdge, 2);
    if(input.sizeGt(i+1) && isClassCode(input[i+1])) {
      char code = input[i+1];
      i += 2;
      bool neg = isupper(static_cast<unsigned char>(code));
      return make_unique<RegexCharSet>(classRanges(tolower(code)), neg);
    }
    if(auto opt = parseEscapeCode(ctx, i, stringMeta))
      return make_unique<RegexString>(string(1, *opt));
    else return nullptr;
  }
  else if(ch == '^') return reta(RegexAnchor::bol, 1);
  else if(ch == '$') return reta(RegexAnchor::eol, 1);
  else return make_unique<RegexString>(string(1, input[i++]));
}

// Consecutive string parts get joined into a single string.
auto contractStrings(RegexConcat concat) -> RegexConcat {
  vector<unique_ptr<const Regex>> rvparts;
  string acc;
  for(unique_ptr<const Regex>& part: concat.parts) {
    if(part->nodeType == RegexNodeType::string) {
      acc.append(static_cast<const RegexString&>(*part).value);
    }else {
      if(!acc.empty())
        rvparts.push_back(make_unique<RegexString>(std::move(acc)));
      acc.clear();
      rvparts.push_back(std::move(part));
    }
  }
  if(!acc.empty())
    rvparts.push_back(make_unique<RegexString>(std::move(acc)));
  return RegexConcat(std::move(rvparts));
}

// op is assumed to be one of [+*?].
unique_ptr<const Regex> repeatWith(unique_ptr<const Regex> regex, char op) {
  switch(op) {
    case '+': return move_to_unique(RegexRepeat{std::move(regex)});
    case '?': return move_to_unique(RegexOptional{std::move(regex)});
    case '*': return move_to_unique(RegexOptional{
                       move_to_unique(RegexRepeat{std::move(regex)})
                     });
    default: Bug("repeatWith called with invalid op: {}", op);
  }
}

// Assumes startsRepeat(ctx.input[i]) == true.
bool repeatBack(InputDiags& ctx, size_t& i, RegexConcat& concat) {
  char ch = ctx.input[i];
  ++i;
  if(ch == '{') {
    Error(ctx, i-1, i, "Counted repetition with '{' is not supported");
    return false;
  }
  if(concat.parts.empty()) {
    Error(ctx, i-1, i, "Nothing to repeat");
    return false;
  }
  concat.parts.back() = repeatWith(std::move(concat.parts.back()), ch);
  return true;
}

// Used with T being one of RegexConcat or RegexOrList.
template <class T>
auto unpackSingleton(T t) -> unique_ptr<const Regex> {
  if(t.parts.size() == 0) return make_unique<RegexString>(string());
  else if(t.parts.size() == 1) return std::move(t.parts[0]);
  else return make_unique<T>(std::move(t));
}

// Stops at ')', '|', or the end of input, none of which it consumes.
auto parseBranch(InputDiags& ctx, size_t& i, uint8_t depth)
  -> unique_ptr<const Regex> {
  const InputPiece& input = ctx.input;
  size_t j = i;
  size_t repdepth = 0;
  RegexConcat concat;
  unique_ptr<const Regex> subres;

  while(input.sizeGt(j) && !is_in(input[j], ")|")) {
    if(input[j] == '[') subres = parseCharSetUnq(ctx, j);
    else if(input[j] == '(') subres = parseGroup(ctx, j, depth + repdepth);
    else if(startsRepeat(input[j])) {
      if(++repdepth > kMaxRepDepth) {
        Error(ctx, j, j+1, "Too many consecutive repeat operators.");
        return nullptr;
      }else if(!repeatBack(ctx, j, concat)) return nullptr;
      else continue;  // Skip checking subres.
    }else if(input[j] == '.') {
      subres = move_to_unique(RegexCharSet{{}, true});
      ++j;
    }else subres = parseSingleChar(ctx, j);

    repdepth = 0;
    if(!subres) return nullptr;
    concat.parts.push_back(std::move(subres));
  }
  i = j;
  return unpackSingleton(contractStrings(std::move(concat)));
}

// Stops at an unmatched ')' or at the end of input.
auto parseRec(InputDiags& ctx, size_t& i, uint8_t depth)
  -> unique_ptr<const Regex> {
  size_t j = i;
  RegexOrList ors;

  while(true) {
    unique_ptr<const Regex> subres = parseBranch(ctx, j, depth);
    if(!subres) return nullptr;
    ors.parts.push_back(std::move(subres));
    if(!hasChar(ctx.input,j,'|')) break;
    ++j;
  }
  i = j;
  return unpackSingleton(std::move(ors));
}

}  // namespace

RegexCharSet parseRegexCharSet(string input) {
  InputDiags ctx{Input{input}};
  size_t i = 0;
  if(auto cs = parseCharSetUnq(ctx, i)) return std::move(*cs);
  else {
    for(const auto& d : ctx.diags) BugWarn("{}", string(d));
    Bug("parseRegexCharSet() input was invalid: {}", input);
  }
}

auto parseRegex(InputDiags& ctx, size_t& i) -> unique_ptr<const Regex> {
  const InputPiece& input = ctx.input;
  size_t j = i;
  auto rv = parseRec(ctx, j, 0);
  if(!rv) return rv;
  if(hasChar(input,j,')')) {
    Error(ctx, j, j+1, "Unmatched ')'");
    return nullptr;
  }else if(input.sizeGt(j))
    Bug("Pattern parsing ended unexpectedly at position {}", j);
  // Errors inside sets don't always abort parsing.
  if(hasError(ctx.diags)) return nullptr;
  i = j;
  return rv;
}

}  // namespace ruler
