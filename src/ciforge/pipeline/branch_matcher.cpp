#include "ciforge/pipeline/branch_matcher.hpp"

#include <algorithm>
#include <cctype>

namespace ciforge {

auto BranchMatcher::compile(std::string_view pattern) -> Result<BranchMatcher> {
  BranchMatcher out;
  out.pattern_ = std::string(pattern);

  std::string_view body = pattern;
  if (body.starts_with('!')) {
    out.exclusion_ = true;
    body.remove_prefix(1);
  }
  if (body.empty()) {
    return fail(Error::ValidationError);
  }

  for (std::size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    const auto uc = static_cast<unsigned char>(c);
    if (std::iscntrl(uc) != 0 || std::isspace(uc) != 0) {
      return fail(Error::ValidationError);
    }

    switch (c) {
    case '*': {
      std::size_t run = 1;
      while (i + run < body.size() && body[i + run] == '*') {
        ++run;
      }
      if (run > 2) {
        return fail(Error::ValidationError);
      }
      out.tokens_.push_back(
          Token{.kind = run == 2 ? Kind::DoubleStar : Kind::Star});
      i += run - 1;
      break;
    }
    case '?':
      out.tokens_.push_back(Token{.kind = Kind::AnyChar});
      break;
    case '[': {
      Token token{.kind = Kind::Class};
      std::size_t j = i + 1;
      if (j < body.size() && body[j] == '!') {
        token.negated = true;
        ++j;
      }
      const std::size_t class_start = j;
      while (j < body.size() && (body[j] != ']' || j == class_start)) {
        char lo = body[j];
        char hi = lo;
        if (j + 2 < body.size() && body[j + 1] == '-' && body[j + 2] != ']') {
          hi = body[j + 2];
          j += 2;
        }
        if (hi < lo) {
          return fail(Error::ValidationError);
        }
        token.ranges.emplace_back(lo, hi);
        ++j;
      }
      if (j >= body.size() || token.ranges.empty()) {
        return fail(Error::ValidationError);
      }
      out.tokens_.push_back(std::move(token));
      i = j;
      break;
    }
    case ']':
      return fail(Error::ValidationError);
    default:
      out.tokens_.push_back(Token{.kind = Kind::Literal, .ch = c});
      break;
    }
  }
  return ok(std::move(out));
}

auto BranchMatcher::class_contains(const Token &token, char c) -> bool {
  const bool in_ranges =
      std::ranges::any_of(token.ranges, [c](const auto &range) {
        return c >= range.first && c <= range.second;
      });
  return in_ranges != token.negated;
}

auto BranchMatcher::matches(std::string_view branch) const -> bool {
  // next[j]: tokens_[i + 1..] match branch[j..]; cur[j]: tokens_[i..] do.
  const std::size_t n = branch.size();
  std::vector<char> next(n + 1, 0);
  std::vector<char> cur(n + 1, 0);
  next[n] = 1;

  for (std::size_t ti = tokens_.size(); ti-- > 0;) {
    const auto &token = tokens_[ti];
    cur[n] = (token.kind == Kind::Star || token.kind == Kind::DoubleStar)
                 ? next[n]
                 : 0;
    for (std::size_t j = n; j-- > 0;) {
      const char c = branch[j];
      switch (token.kind) {
      case Kind::Literal:
        cur[j] = c == token.ch && next[j + 1];
        break;
      case Kind::AnyChar:
        cur[j] = c != '/' && next[j + 1];
        break;
      case Kind::Class:
        cur[j] = c != '/' && class_contains(token, c) && next[j + 1];
        break;
      case Kind::Star:
        cur[j] = next[j] || (c != '/' && cur[j + 1]);
        break;
      case Kind::DoubleStar:
        cur[j] = next[j] || cur[j + 1];
        break;
      }
    }
    std::swap(cur, next);
  }
  return next[0] != 0;
}

auto BranchFilter::matches(std::string_view branch) const -> bool {
  if (matchers_.empty()) {
    return true;
  }
  // With only exclusions, everything not excluded matches.
  bool matched = std::ranges::all_of(
      matchers_, [](const auto &m) { return m.is_exclusion(); });
  for (const auto &matcher : matchers_) {
    if (matcher.matches(branch)) {
      matched = !matcher.is_exclusion();
    }
  }
  return matched;
}

auto BranchFilter::patterns() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(matchers_.size());
  for (const auto &matcher : matchers_) {
    out.push_back(matcher.pattern());
  }
  return out;
}

} // namespace ciforge
