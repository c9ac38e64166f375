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

#include "input_view.h"
#include <algorithm>
#include "util.h"
using std::lower_bound;
using std::make_pair;
using std::pair;
using std::string;
using std::string_view;
using std::vector;

namespace ruler {

vector<size_t> Input::allNewlines(string_view s) {
  vector<size_t> rv;
  for(size_t i=0; i<s.size(); ++i) if(s[i] == '\n') rv.push_back(i);
  return rv;
}

char Input::operator[](size_t i) const {
  if(i >= buf_.size())
    Bug("Out of bound error. {} is beyond the end of input.", i);
  return buf_[i];
}

string Input::substr(size_t pos, size_t count) const {
  if(pos > buf_.size())
    Bug("Out of bound error. substr() starting at {} is beyond the end "
        "of input.", pos);
  return buf_.substr(pos, count);
}

pair<size_t,size_t> Input::rowCol(size_t i) const {
  if(newlines_.empty() || i<=newlines_[0]) return make_pair(1, 1+i);
  size_t prev = lower_bound(newlines_.begin(), newlines_.end(), i)
                - newlines_.begin() - 1;
  return make_pair(prev+2, i-newlines_[prev]);
}

char InputView::operator[](size_t i) const {
  if(i >= s_.size())
    Bug("Out of bound error. {} is beyond the end of input view.", i);
  return s_[i];
}

string InputView::substr(size_t pos, size_t count) const {
  if(pos > s_.size())
    Bug("Out of bound error. substr() starting at {} is beyond the end "
        "of input view.", pos);
  return string(s_.substr(pos, count));
}

}  // namespace ruler
