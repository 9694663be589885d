#pragma once

#include "ciforge/core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ciforge {

/// One compiled branch glob.
///
///   `*`       any run of characters except `/`
///   `**`      any run of characters, `/` included
///   `?`       exactly one character other than `/`
///   `[a-z]`   one character from the class, `[!...]` negates
///
/// A leading `!` turns the pattern into an exclusion inside a BranchFilter.
class BranchMatcher {
public:
  [[nodiscard]] static auto compile(std::string_view pattern)
      -> Result<BranchMatcher>;

  [[nodiscard]] auto matches(std::string_view branch) const -> bool;
  [[nodiscard]] auto pattern() const noexcept -> const std::string & {
    return pattern_;
  }
  [[nodiscard]] auto is_exclusion() const noexcept -> bool {
    return exclusion_;
  }

private:
  enum class Kind : std::uint8_t { Literal, AnyChar, Star, DoubleStar, Class };

  struct Token {
    Kind kind{Kind::Literal};
    char ch{0};
    bool negated{false};
    std::vector<std::pair<char, char>> ranges;
  };

  [[nodiscard]] static auto class_contains(const Token &token, char c) -> bool;

  std::string pattern_;
  bool exclusion_{false};
  std::vector<Token> tokens_;
};

/// Ordered list of branch globs. The last pattern that matches decides;
/// an empty filter matches every branch.
class BranchFilter {
public:
  BranchFilter() = default;
  explicit BranchFilter(std::vector<BranchMatcher> matchers)
      : matchers_(std::move(matchers)) {}

  [[nodiscard]] auto matches(std::string_view branch) const -> bool;
  [[nodiscard]] auto empty() const noexcept -> bool {
    return matchers_.empty();
  }
  [[nodiscard]] auto patterns() const -> std::vector<std::string>;

private:
  std::vector<BranchMatcher> matchers_;
};

} // namespace ciforge
