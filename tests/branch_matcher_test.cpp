#include "ciforge/pipeline/branch_matcher.hpp"

#include <string_view>
#include <vector>

#include "gtest/gtest.h"

using namespace ciforge;

namespace {
auto compile(std::string_view pattern) -> BranchMatcher {
  auto m = BranchMatcher::compile(pattern);
  EXPECT_TRUE(m.has_value()) << pattern;
  return std::move(*m);
}

auto filter(std::vector<std::string_view> patterns) -> BranchFilter {
  std::vector<BranchMatcher> matchers;
  for (auto p : patterns) {
    matchers.push_back(compile(p));
  }
  return BranchFilter{std::move(matchers)};
}
} // namespace

TEST(BranchMatcherTest, LiteralMatchesExactly) {
  auto m = compile("main");
  EXPECT_TRUE(m.matches("main"));
  EXPECT_FALSE(m.matches("main2"));
  EXPECT_FALSE(m.matches("mai"));
  EXPECT_FALSE(m.matches(""));
}

TEST(BranchMatcherTest, StarStopsAtSlash) {
  auto m = compile("feature/*");
  EXPECT_TRUE(m.matches("feature/login"));
  EXPECT_TRUE(m.matches("feature/"));
  EXPECT_FALSE(m.matches("feature/a/b"));
  EXPECT_FALSE(m.matches("features/x"));
}

TEST(BranchMatcherTest, DoubleStarCrossesSlash) {
  auto m = compile("release/**");
  EXPECT_TRUE(m.matches("release/1.0"));
  EXPECT_TRUE(m.matches("release/1.x/hotfix"));
  EXPECT_FALSE(m.matches("main"));

  auto everything = compile("**");
  EXPECT_TRUE(everything.matches("a/b/c"));
  EXPECT_TRUE(everything.matches(""));
}

TEST(BranchMatcherTest, QuestionMarkMatchesOneCharacter) {
  auto m = compile("v?");
  EXPECT_TRUE(m.matches("v1"));
  EXPECT_FALSE(m.matches("v"));
  EXPECT_FALSE(m.matches("v12"));
  EXPECT_FALSE(m.matches("v/"));
}

TEST(BranchMatcherTest, CharacterClass) {
  auto m = compile("hotfix-[0-9]");
  EXPECT_TRUE(m.matches("hotfix-7"));
  EXPECT_FALSE(m.matches("hotfix-a"));

  auto negated = compile("x[!ab]");
  EXPECT_TRUE(negated.matches("xc"));
  EXPECT_FALSE(negated.matches("xa"));
}

TEST(BranchMatcherTest, LeadingBangMarksExclusion) {
  auto m = compile("!wip/*");
  EXPECT_TRUE(m.is_exclusion());
  EXPECT_EQ(m.pattern(), "!wip/*");
  EXPECT_TRUE(m.matches("wip/thing"));
}

TEST(BranchMatcherTest, InvalidPatternsRejected) {
  EXPECT_FALSE(BranchMatcher::compile("").has_value());
  EXPECT_FALSE(BranchMatcher::compile("!").has_value());
  EXPECT_FALSE(BranchMatcher::compile("a***").has_value());
  EXPECT_FALSE(BranchMatcher::compile("[abc").has_value());
  EXPECT_FALSE(BranchMatcher::compile("a]").has_value());
  EXPECT_FALSE(BranchMatcher::compile("has space").has_value());
  EXPECT_FALSE(BranchMatcher::compile("[z-a]").has_value());

  auto err = BranchMatcher::compile("[abc");
  EXPECT_EQ(err.error(), make_error_code(Error::ValidationError));
}

TEST(BranchFilterTest, EmptyFilterMatchesEverything) {
  BranchFilter f;
  EXPECT_TRUE(f.empty());
  EXPECT_TRUE(f.matches("anything/at/all"));
}

TEST(BranchFilterTest, LastMatchingPatternDecides) {
  auto f = filter({"feature/**", "!feature/experimental/**"});
  EXPECT_TRUE(f.matches("feature/a"));
  EXPECT_FALSE(f.matches("feature/experimental/x"));
  EXPECT_FALSE(f.matches("main"));

  auto reinclude =
      filter({"feature/**", "!feature/experimental/**", "feature/experimental/keep"});
  EXPECT_TRUE(reinclude.matches("feature/experimental/keep"));
}

TEST(BranchFilterTest, OnlyExclusionsMatchTheRest) {
  auto f = filter({"!gh-pages"});
  EXPECT_TRUE(f.matches("main"));
  EXPECT_FALSE(f.matches("gh-pages"));
}

TEST(BranchFilterTest, PatternsKeepDeclarationOrder) {
  auto f = filter({"main", "release/*"});
  auto patterns = f.patterns();
  ASSERT_EQ(patterns.size(), 2u);
  EXPECT_EQ(patterns[0], "main");
  EXPECT_EQ(patterns[1], "release/*");
}
