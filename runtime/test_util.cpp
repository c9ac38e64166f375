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

#include "test_util.h"
#include <iterator>
using fmt::format_to;
using fmt::memory_buffer;
using fmt::print;
using fmt::to_string;
using std::string;
using std::string_view;
using std::vector;

auto fmt::formatter<std::vector<std::string>>::format(
    const vector<string>& v, fmt::format_context& ctx) const
  -> fmt::format_context::iterator {
  if(v.empty()) return format_to(ctx.out(), "{{}}");
  format_to(ctx.out(), "{{{}", v[0]);
  for(size_t i=1;i<v.size();++i) format_to(ctx.out(), ", {}", v[i]);
  return format_to(ctx.out(), "}}");
}

namespace ruler {

void showDiags(const vector<Diag>& diags) {
  memory_buffer buf;
  format_to(std::back_inserter(buf), "diags:\n");
  for(const auto& d : diags)
    format_to(std::back_inserter(buf), "  {}\n", string(d));
  BugWarn("{}", to_string(buf));
}

void assertHasDiagWithSubstr(string_view testName, const vector<Diag>& diags,
                             string_view expectedDiag) {
  for(const Diag& d : diags) if(isSubstr(expectedDiag, d.msg)) return;
  showDiags(diags);
  Bug("{} didn't get the expected diag: {}", testName, expectedDiag);
}

void assertHasDiagWithSubstrAt(string_view testName, const vector<Diag>& diags,
                               string_view expectedDiag, size_t expectedStPos) {
  for(const Diag& d : diags) {
    if(d.stPos != expectedStPos+1) continue;  // The +1 is from Diag() ctor
    if(!isSubstr(expectedDiag, d.msg)) continue;
    return;
  }
  showDiags(diags);
  Bug("{} didn't get the expected diag at position {}: {}",
      testName, expectedStPos, expectedDiag);
}

void assertEmptyDiags(string_view testName, const vector<Diag>& diags) {
  if(diags.empty()) return;
  for(const auto& d:diags) print(stderr, "{}\n", string(d));
  Bug("{} had unexpected errors", testName);
}

void assertWhatHasSubstr(string_view msg, const std::exception& ex,
                         string_view expected_what) {
  if(!isSubstr(expected_what, ex.what()))
    Bug("{}: Got unexpected exception '{}', expected '{}'",
        msg, ex.what(), expected_what);
}

}  // namespace ruler
