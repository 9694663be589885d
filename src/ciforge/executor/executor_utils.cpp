#include "ciforge/executor/executor_utils.hpp"

namespace ciforge {

auto split_command_line(std::string_view command)
    -> Result<std::vector<std::string>> {
  std::vector<std::string> argv;
  std::string word;
  bool in_word = false;

  for (std::size_t i = 0; i < command.size(); ++i) {
    const char c = command[i];
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (in_word) {
        argv.push_back(std::move(word));
        word.clear();
        in_word = false;
      }
      continue;
    }

    in_word = true;
    if (c == '\'') {
      const auto close = command.find('\'', i + 1);
      if (close == std::string_view::npos) {
        return fail(Error::InvalidArgument);
      }
      word.append(command.substr(i + 1, close - i - 1));
      i = close;
    } else if (c == '"') {
      bool closed = false;
      for (++i; i < command.size(); ++i) {
        if (command[i] == '"') {
          closed = true;
          break;
        }
        if (command[i] == '\\' && i + 1 < command.size() &&
            (command[i + 1] == '"' || command[i + 1] == '\\')) {
          ++i;
        }
        word.push_back(command[i]);
      }
      if (!closed) {
        return fail(Error::InvalidArgument);
      }
    } else if (c == '\\') {
      if (i + 1 >= command.size()) {
        return fail(Error::InvalidArgument);
      }
      word.push_back(command[++i]);
    } else {
      word.push_back(c);
    }
  }
  if (in_word) {
    argv.push_back(std::move(word));
  }
  if (argv.empty()) {
    return fail(Error::InvalidArgument);
  }
  return ok(std::move(argv));
}

} // namespace ciforge
