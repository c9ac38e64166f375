/*  Copyright 2019-2025 The ruler authors.

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
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ruler {

// The minimal character-access interface the regex engine and the pattern
// parser need. Positions are always relative to the start of the piece.
class InputPiece {
 public:
  virtual char operator[](size_t i) const = 0;
  virtual bool sizeGt(size_t sz) const = 0;
  // Like std::string::substr, silently truncates if count is too large.
  // Throws BugEx if pos is beyond the end.
  virtual std::string substr(size_t pos, size_t count) const = 0;
  virtual ~InputPiece() = default;
};

// Owns its text, and keeps track of line boundaries so diagnostics can report
// line and column numbers. Used for grammar patterns and for whole inputs
// that need to be reported on.
//
// Convention: Input is move-only. Leaf matchers never copy the text they are
// matching; they work on an InputView of the unconsumed remainder instead.
class Input final : public InputPiece {
 public:
  static constexpr auto npos = std::numeric_limits<size_t>::max();

  explicit Input(std::string s)
    : buf_(std::move(s)), newlines_(allNewlines(buf_)) {}
  Input(const Input&) = delete;
  Input(Input&&) = default;
  Input& operator=(const Input&) = delete;
  Input& operator=(Input&&) = default;

  char operator[](size_t i) const override;
  bool sizeGt(size_t pos) const override { return pos < buf_.size(); }
  size_t size() const { return buf_.size(); }


  // Returns 1-based positions: line number, and offset in that line.
  // Everything else in this class is 0-based. Positions at or past the end
  // are reported as if the last line kept going.
  std::pair<size_t,size_t> rowCol(size_t i) const;

  std::string substr(size_t pos, size_t count) const override;

 private:
  std::string buf_;
  std::vector<size_t> newlines_;

  static std::vector<size_t> allNewlines(std::string_view s);
};

// Non-owning view, typically over the part of the user's text a rule is being
// matched against. The viewed string must outlive this object.
class InputView final : public InputPiece {
 public:
  explicit InputView(std::string_view s) : s_(s) {}

  char operator[](size_t i) const override;
  bool sizeGt(size_t pos) const override { return pos < s_.size(); }
  std::string substr(size_t pos, size_t count) const override;

 private:
  std::string_view s_;
};

}  // namespace ruler
