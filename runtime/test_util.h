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

#include <exception>
#include <string>
#include <string_view>
#include <vector>
#include "fmt/format.h"
#include "diags.h"
#include "util.h"
#include "util_impl.h"

template <>
struct fmt::formatter<std::vector<std::string>> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

  auto format(const std::vector<std::string>& v, format_context& ctx) const
    -> format_context::iterator;
};

namespace ruler {

template <class ... Args> [[noreturn]] void
  BugMeImpl(const char testName[], const char* fmt, const Args& ... args) {
    Bug(fmt::format("{}: {}", testName, fmt).data(), args...);
}

#define BugMe(...) ruler::BugMeImpl(__func__, __VA_ARGS__)
#define me(msg) fmt::format("{}: {}", __func__, msg)

template <class X, class Y>
void assertEqual(std::string_view msg, const X& a, const Y& b) {
  if(a!=b) Bug("{}: '{}' != '{}'", msg, a, b);
}

void showDiags(const std::vector<Diag>& diags);

void assertHasDiagWithSubstr(std::string_view testName,
                             const std::vector<Diag>& diags,
                             std::string_view expectedDiag);

void assertHasDiagWithSubstrAt(std::string_view testName,
                               const std::vector<Diag>& diags,
                               std::string_view expectedDiag,
                               size_t expectedStPos);

void assertEmptyDiags(std::string_view testName,
                      const std::vector<Diag>& diags);

void assertWhatHasSubstr(std::string_view msg, const std::exception& ex,
                         std::string_view expected_what);

// cb is called as cb(ctx, i), with i starting at 0. UserErrorEx thrown by cb
// is demoted to an error diag before checking.
template <class Cb>
void assertProducesDiag(std::string_view testName, std::string_view input,
                        std::string_view err, Cb cb) {
  InputDiags ctx{Input{std::string(input)}};
  size_t i = 0;
  try {
    cb(ctx, i);
  }catch(const UserErrorEx& ex) {
    Error(ctx, 0, 0, ex.what());
  }
  assertHasDiagWithSubstr(testName, ctx.diags, err);
}

}  // namespace ruler
