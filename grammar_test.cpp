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

#include "grammar.h"
#include <atomic>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include "runtime/test_util.h"
using ruler::assertEqual;
using ruler::assertWhatHasSubstr;
using ruler::Bug;
using ruler::Grammar;
using ruler::GrammarBuilder;
using ruler::Literal;
using ruler::MatchPtr;
using ruler::MatchResult;
using ruler::named;
using ruler::OneOf;
using ruler::Opt;
using ruler::Pattern;
using ruler::RuleNamingEx;
using ruler::RulePtr;
using ruler::Seq;
using ruler::Token;
using std::string;
using std::string_view;
using std::vector;

namespace {

Grammar morningGrammar() {
  GrammarBuilder gb;
  RulePtr who = gb.define("who", OneOf("John", "Peter", "Ann"));
  RulePtr juice = gb.define("juice", Seq("juice"));
  RulePtr milk = gb.define("milk", Opt(" with milk"));
  RulePtr tea = gb.define("tea", Seq("tea", milk));
  RulePtr what = gb.define("what", OneOf(juice, tea));
  return gb.build(Seq(who, " likes to drink ", what, "."));
}

MatchPtr mustMatch(string_view testName, const Grammar& g, string_view text) {
  MatchResult res = g.match(text);
  if(!res) Bug("{}: failed to match. {}", testName,
               res.mismatch->render(text));
  if(res.mismatch) Bug("{}: got both a match and a mismatch", testName);
  return res.match;
}

void testMorningMatches() {
  Grammar g = morningGrammar();
  MatchPtr m = mustMatch(__func__, g, "Ann likes to drink tea with milk.");
  assertEqual(__func__, m->text(), "Ann likes to drink tea with milk.");
  assertEqual(__func__, *m->get("who"), "Ann");
  assertEqual(__func__, *m->get("what"), "tea with milk");
  if(m->get("what")->get("juice")) BugMe("juice should be absent");
  assertEqual(__func__, *m->get("what")->get("tea"), "tea with milk");
  assertEqual(__func__, *m->get("what")->get("tea")->get("milk"), " with milk");
  if(m->get("what")->get("tea")->declares("sugar"))
    BugMe("sugar was never declared");

  m = mustMatch(__func__, g, "Peter likes to drink tea.");
  assertEqual(__func__, *m->get("who"), "Peter");
  assertEqual(__func__, *m->get("what"), "tea");
  if(m->get("what")->get("tea")->get("milk")) BugMe("milk should be absent");

  m = mustMatch(__func__, g, "John likes to drink juice.");
  assertEqual(__func__, *m->get("what")->get("juice"), "juice");
  if(m->get("what")->get("tea")) BugMe("tea should be absent");
}

void testMorningMismatches() {
  Grammar g = morningGrammar();
  string text = "Peter likes to drink coffee.";
  MatchResult res = g.match(text);
  if(res || res.match) BugMe("Nobody drinks coffee here");
  assertEqual(__func__, res.mismatch->position(), size_t{21});
  assertEqual(__func__, res.mismatch->render(text),
      "Mismatch at 21:\n"
      "  Peter likes to drink coffee.\n"
      "                       ^\n"
      "\"coffee.\" does not match \"juice\"\n"
      "\"coffee.\" does not match \"tea\"");

  text = "Peter likes to drink tea with lemon.";
  res = g.match(text);
  if(res) BugMe("Lemon is not milk");
  assertEqual(__func__, res.mismatch->position(), size_t{24});
  assertEqual(__func__, res.mismatch->description(),
              "\" with lemon.\" does not match \".\"");

  res = g.match("Ann likes to drink tea");
  if(res) BugMe("The final period is missing");
  assertEqual(__func__, res.mismatch->position(), size_t{22});
  assertEqual(__func__, res.mismatch->description(),
              "reached end of input but expected \".\"");
}

void testPeopleList() {
  GrammarBuilder gb;
  RulePtr person = gb.define("person",
      OneOf("John", "Peter", "Ann", "Paul", "Rachel"));
  RulePtr who = gb.define("who",
      Seq(person, Opt(", ", person), Opt(" and ", person)));
  RulePtr what = gb.define("what", OneOf("juice", "tea"));
  Grammar g = gb.build(Seq(who, " like", Opt("s"), " to drink ", what, "."));

  MatchPtr m = mustMatch(__func__, g,
                         "Peter, Rachel and Ann like to drink tea.");
  assertEqual(__func__, *m->get("who"), "Peter, Rachel and Ann");
  Token people = m->get("who")->get("person");
  assertEqual(__func__, people.size(), size_t{3});
  assertEqual(__func__, people.at(0)->text(), "Peter");
  assertEqual(__func__, people.at(1)->text(), "Rachel");
  assertEqual(__func__, people.at(2)->text(), "Ann");

  m = mustMatch(__func__, g, "Ann likes to drink juice.");
  people = m->get("who")->get("person");
  assertEqual(__func__, people.size(), size_t{3});
  assertEqual(__func__, people.at(0)->text(), "Ann");
  if(people.at(1) || people.at(2)) BugMe("Only one person was listed");
  assertEqual(__func__, *m->get("what"), "juice");
}

void testNestedRules() {
  GrammarBuilder gb;
  RulePtr cd = gb.define("cd", Seq("c", "d"));
  RulePtr bcd = gb.define("bcd", Seq("b", cd));
  RulePtr e = gb.define("e", Seq("e"));
  Grammar g = gb.build(Seq("a", bcd, e));

  MatchPtr m = mustMatch(__func__, g, "abcde");
  assertEqual(__func__, m->text(), "abcde");
  assertEqual(__func__, *m->get("bcd"), "bcd");
  assertEqual(__func__, *m->get("bcd")->get("cd"), "cd");
  assertEqual(__func__, *m->get("e"), "e");

  MatchResult res = g.match("abcef");
  if(res) BugMe("abcef should not match");
  assertEqual(__func__, res.mismatch->position(), size_t{3});
}

void testRuleReuse() {
  GrammarBuilder gb;
  RulePtr reused = gb.define("reused", Seq(Pattern("..")));
  RulePtr a = gb.define("a", Seq("a", reused));
  RulePtr b = gb.define("b", Seq("b", reused));
  RulePtr c = gb.define("c", Seq("c", reused));
  Grammar g = gb.build(Seq(a, b, c));

  MatchPtr m = mustMatch(__func__, g, "a11b22c33");
  assertEqual(__func__, *m->get("a"), "a11");
  assertEqual(__func__, *m->get("a")->get("reused"), "11");
  assertEqual(__func__, *m->get("b"), "b22");
  assertEqual(__func__, *m->get("b")->get("reused"), "22");
  assertEqual(__func__, *m->get("c"), "c33");
  assertEqual(__func__, *m->get("c")->get("reused"), "33");
}

void testEmptyRules() {
  GrammarBuilder gb;
  RulePtr a = gb.define("a", Seq(""));
  RulePtr b = gb.define("b", Seq(a, a));
  RulePtr c = gb.define("c", OneOf(a, a, a));
  RulePtr d = gb.define("d", Opt(b));
  Grammar g = gb.build(Seq(a, b, c, d));

  MatchPtr m = mustMatch(__func__, g, "");
  assertEqual(__func__, m->text(), "");
  assertEqual(__func__, *m->get("a"), "");
  assertEqual(__func__, *m->get("b"), "");
  Token ba = m->get("b")->get("a");
  assertEqual(__func__, int{ba.kind()}, int{Token::list});
  assertEqual(__func__, ba.size(), size_t{2});
  assertEqual(__func__, ba.at(0)->text(), "");
  assertEqual(__func__, ba.at(1)->text(), "");

  Token ca = m->get("c")->get("a");
  assertEqual(__func__, int{ca.kind()}, int{Token::list});
  assertEqual(__func__, ca.size(), size_t{3});
  assertEqual(__func__, ca.at(0)->text(), "");
  if(ca.at(1) || ca.at(2)) BugMe("Only the first empty branch fires");

  assertEqual(__func__, *m->get("d"), "");
  assertEqual(__func__, *m->get("d")->get("b"), "");
  assertEqual(__func__, m->get("d")->get("b")->get("a").at(1)->text(), "");

  // Trailing input is fine. Only a prefix needs to match.
  assertEqual(__func__, mustMatch(__func__, g, "xyz")->text(), "");
}

void testOptionalRoot() {
  Grammar g(Opt("a", named("b", Literal("b"))));
  MatchPtr m = mustMatch(__func__, g, "ac");
  assertEqual(__func__, m->text(), "");
  if(!m->declares("b") || m->get("b"))
    BugMe("A skipped root should still declare b, as absent");
  m = mustMatch(__func__, g, "abc");
  assertEqual(__func__, *m->get("b"), "b");
}

void testBuilderNaming() {
  RulePtr juice = named("juice", Seq("juice"));
  GrammarBuilder gb;
  gb.define("juice", juice);  // Same name, so nothing changes.
  gb.define("drink", juice);
  try {
    gb.build(Seq(juice));
    BugMe("Expected a renaming error");
  }catch(const RuleNamingEx& ex) {
    assertWhatHasSubstr(__func__, ex, "Cannot rename rule juice to drink");
  }

  GrammarBuilder gb2;
  RulePtr tea = gb2.define("tea", Seq("tea"));
  if(tea->nameOrNull()) BugMe("Names should only be assigned by build()");
  Grammar g = gb2.build(OneOf(tea, "coffee"));
  assertEqual(__func__, *tea->nameOrNull(), "tea");
  vector<const ruler::Rule*> rules = g.tokenRules("tea");
  assertEqual(__func__, rules.size(), size_t{1});
  if(rules[0] != tea.get()) BugMe("tokenRules() returned the wrong rule");
  if(!g.tokenRules("coffee").empty()) BugMe("coffee was never named");
  if(&g.root() == tea.get()) BugMe("root() should be the OneOf");
}

// A build that fails on a later binding leaves earlier rules unnamed.
void testFailedBuildNamesNothing() {
  RulePtr juice = named("juice", Seq("juice"));
  GrammarBuilder gb;
  RulePtr tea = gb.define("tea", Seq("tea"));
  gb.define("drink", juice);
  try {
    gb.build(OneOf(tea, juice));
    BugMe("Expected a renaming error");
  }catch(const RuleNamingEx& ex) {
    assertWhatHasSubstr(__func__, ex, "Cannot rename rule juice to drink");
  }
  if(tea->nameOrNull()) BugMe("tea was named by a failed build");

  GrammarBuilder gb2;
  RulePtr milk = gb2.define("milk", Opt(" with milk"));
  RulePtr cream = gb2.define("cream", Seq("cream"));
  gb2.define("dairy", milk);
  try {
    gb2.build(Seq(milk, cream));
    BugMe("Expected an error for two names on one rule");
  }catch(const RuleNamingEx& ex) {
    assertWhatHasSubstr(__func__, ex, "both milk and dairy");
  }
  if(milk->nameOrNull() || cream->nameOrNull())
    BugMe("A failed build should not name anything");
}

// One Grammar, many threads, no locks.
void testConcurrentMatching() {
  const Grammar g = morningGrammar();
  const vector<string> inputs{
    "Ann likes to drink tea with milk.",
    "Peter likes to drink coffee.",
    "John likes to drink juice.",
    "Peter likes to drink tea with lemon.",
  };
  std::atomic<int> wrong{0};
  auto worker = [&](size_t offset) {
    for(size_t i=0; i<200; ++i) {
      const string& text = inputs[(i+offset) % inputs.size()];
      MatchResult res = g.match(text);
      switch((i+offset) % inputs.size()) {
        case 0:
          if(!res || *res.match->get("what")->get("tea")->get("milk")
                     != " with milk") ++wrong;
          break;
        case 1:
          if(res || res.mismatch->position() != 21) ++wrong;
          break;
        case 2:
          if(!res || *res.match->get("who") != "John") ++wrong;
          break;
        case 3:
          if(res || res.mismatch->position() != 24) ++wrong;
          break;
      }
    }
  };
  vector<std::thread> threads;
  for(size_t t=0; t<8; ++t) threads.emplace_back(worker, t);
  for(auto& th : threads) th.join();
  assertEqual(__func__, wrong.load(), 0);
}

}  // namespace

int main() {
  testMorningMatches();
  testMorningMismatches();
  testPeopleList();
  testNestedRules();
  testRuleReuse();
  testEmptyRules();
  testOptionalRoot();
  testBuilderNaming();
  testFailedBuildNamesNothing();
  testConcurrentMatching();
}
