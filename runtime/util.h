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
#include<cstdio>
#include<memory>
#include<string_view>
#include<utility>
#include<vector>
#include"fmt/core.h"

namespace ruler {

// Usage:
//   if(weird) Bug("Tell me more about {}", x);
//   if(weird) BugWarn("Tell me more about {}", x);
//   if(bad_grammar) UserError("Tell me more about {}", x);
//   if(clash) TokenRedefinition("\"{}\" in {}", name, rule);
//   if(renamed) RuleNamingError("Cannot rename {}", name);

[[noreturn]] void BugImplHelper(const char* fmt, fmt::format_args args);
template <class ... Args>
[[noreturn]] void Bug(const char* fmt, const Args& ... args) {
  BugImplHelper(fmt, fmt::make_format_args(args...));
}

[[noreturn]] void
UnimplementedImplHelper(const char* fmt, fmt::format_args args);
template <class ... Args>
[[noreturn]] void Unimplemented(const char* fmt, const Args& ... args) {
  UnimplementedImplHelper(fmt, fmt::make_format_args(args...));
}

[[noreturn]] void
UserErrorImplHelper(const char* fmt, fmt::format_args args);
template <class ... Args>
[[noreturn]] void UserError(const char* fmt, const Args& ... args) {
  UserErrorImplHelper(fmt, fmt::make_format_args(args...));
}

// Grammar authoring mistakes. These are UserError()s with their own
// exception types, so callers can tell them apart from bad patterns.
[[noreturn]] void
TokenRedefinitionImplHelper(const char* fmt, fmt::format_args args);
template <class ... Args>
[[noreturn]] void TokenRedefinition(const char* fmt, const Args& ... args) {
  TokenRedefinitionImplHelper(fmt, fmt::make_format_args(args...));
}

[[noreturn]] void
RuleNamingImplHelper(const char* fmt, fmt::format_args args);
template <class ... Args>
[[noreturn]] void RuleNamingError(const char* fmt, const Args& ... args) {
  RuleNamingImplHelper(fmt, fmt::make_format_args(args...));
}

template <class ... Args>
void BugWarn(const char* fmt, const Args& ... args) {
  fmt::print(stderr, fmt::runtime(fmt::format("Bug: {}\n", fmt)), args...);
}

// Enables brace-initialization for variants without naming the type twice.
template <class T>
auto move_to_unique(T&& t) -> std::unique_ptr<std::remove_reference_t<T>> {
  return std::make_unique<std::remove_reference_t<T>>(std::move(t));
}

inline bool isSubstr(std::string_view s, std::string_view t) {
  return t.find(s) != std::string_view::npos;
}

inline bool is_in(char ch, std::string_view s) {
  return s.find(ch) != std::string_view::npos;
}

// makeVector<V>(...). Allows construction of a vector with move-only elements,
// or with elements implicitly converted to V.

template <class V, class ... Args> std::vector<V>
makeVector(Args ... args) {
  std::vector<V> rv;
  (rv.push_back(std::move(args)), ...);
  return rv;
}

}  // namespace ruler
