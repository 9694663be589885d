#pragma once

#include "ciforge/util/time.hpp"

#include <chrono>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace ciforge::cli::fmt {

namespace ansi {

// Escape codes are emitted only when stdout is a terminal, so piped and
// --json output stays plain.
inline auto enabled() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout)) != 0;
  return tty;
}

inline auto paint(std::string_view text, std::string_view sgr)
    -> std::string {
  if (!enabled()) {
    return std::string(text);
  }
  return std::format("\033[{}m{}\033[0m", sgr, text);
}

inline auto bold(std::string_view text) -> std::string {
  return paint(text, "1");
}
inline auto dim(std::string_view text) -> std::string {
  return paint(text, "2");
}
inline auto red(std::string_view text) -> std::string {
  return paint(text, "31");
}
inline auto green(std::string_view text) -> std::string {
  return paint(text, "32");
}

// Column width of `s` ignoring SGR sequences.
inline auto visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\033') {
      while (i < s.size() && s[i] != 'm') {
        ++i;
      }
      continue;
    }
    ++width;
  }
  return width;
}

} // namespace ansi

// Run, job and step status names share one palette.
inline auto colorize_status(std::string_view status) -> std::string {
  if (status == "succeeded")
    return ansi::paint(status, "32");
  if (status == "failed" || status == "timed_out")
    return ansi::paint(status, "31");
  if (status == "running")
    return ansi::paint(status, "34");
  if (status == "cancelled")
    return ansi::paint(status, "33");
  if (status == "skipped")
    return ansi::paint(status, "36");
  if (status == "queued" || status == "pending")
    return ansi::dim(status);
  return std::string(status);
}

/// Fixed-width table for the `run` summary. Cells may carry color.
class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    std::vector<std::string> headers;
    std::size_t rule = 0;
    for (const auto &col : columns_) {
      headers.push_back(col.header);
      rule += col.width + 1;
    }
    print_row(headers);
    std::println("{}", std::string(rule > 0 ? rule - 1 : 0, '-'));
  }

  auto print_row(const std::vector<std::string> &cells) const -> void {
    std::string line;
    for (std::size_t i = 0; i < columns_.size() && i < cells.size(); ++i) {
      const auto &col = columns_[i];
      const auto width = ansi::visible_width(cells[i]);
      const std::string pad(width < col.width ? col.width - width : 0, ' ');
      if (i > 0) {
        line += ' ';
      }
      line += col.right_align ? pad + cells[i] : cells[i] + pad;
    }
    std::println("{}", line);
  }

private:
  std::vector<Column> columns_;
};

// "-" when either end is unset.
inline auto format_elapsed(std::chrono::system_clock::time_point start,
                           std::chrono::system_clock::time_point end)
    -> std::string {
  using tp = std::chrono::system_clock::time_point;
  if (start == tp{} || end == tp{}) {
    return "-";
  }
  return util::format_duration(
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start));
}

} // namespace ciforge::cli::fmt
