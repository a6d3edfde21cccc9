#include "hostgate/security/command_syntax.hpp"

namespace hostgate::security {

std::optional<std::string> find_shell_metacharacter(const std::string &command) {
  for (std::size_t i = 0; i < command.size(); ++i) {
    const char ch = command[i];
    switch (ch) {
    case '|':
    case '>':
    case '<':
    case ';':
    case '&':
    case '`':
      return std::string(1, ch);
    case '\n':
    case '\r':
      return std::string("newline");
    case '$':
      if (i + 1 < command.size() && command[i + 1] == '(') {
        return std::string("$(");
      }
      break;
    default:
      break;
    }
  }
  return std::nullopt;
}

common::Result<std::vector<std::string>> tokenize_command(const std::string &command) {
  std::vector<std::string> tokens;
  std::string current;
  bool have_token = false;
  char quote = 0;

  for (std::size_t i = 0; i < command.size(); ++i) {
    const char ch = command[i];

    if (quote == '\'') {
      if (ch == '\'') {
        quote = 0;
      } else {
        current.push_back(ch);
      }
      continue;
    }

    if (quote == '"') {
      if (ch == '"') {
        quote = 0;
      } else if (ch == '\\' && i + 1 < command.size() &&
                 (command[i + 1] == '"' || command[i + 1] == '\\')) {
        current.push_back(command[++i]);
      } else {
        current.push_back(ch);
      }
      continue;
    }

    if (ch == '\\') {
      if (i + 1 >= command.size()) {
        return common::Result<std::vector<std::string>>::failure(
            "dangling escape at end of command", common::ErrorKind::ParseError);
      }
      current.push_back(command[++i]);
      have_token = true;
      continue;
    }

    if (ch == '\'' || ch == '"') {
      quote = ch;
      have_token = true;
      continue;
    }

    if (ch == ' ' || ch == '\t') {
      if (have_token) {
        tokens.push_back(std::move(current));
        current.clear();
        have_token = false;
      }
      continue;
    }

    current.push_back(ch);
    have_token = true;
  }

  if (quote != 0) {
    return common::Result<std::vector<std::string>>::failure(
        std::string("unclosed ") + (quote == '"' ? "double" : "single") + " quote in command",
        common::ErrorKind::ParseError);
  }
  if (have_token) {
    tokens.push_back(std::move(current));
  }
  return common::Result<std::vector<std::string>>::success(std::move(tokens));
}

bool has_path_traversal(const std::vector<std::string> &tokens) {
  for (const auto &token : tokens) {
    if (token.find("..") != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> extract_path_arguments(const std::vector<std::string> &tokens) {
  std::vector<std::string> paths;
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    const auto &token = tokens[i];
    if (token.empty() || token.front() == '-') {
      continue;
    }
    if (token.front() == '/' || token.front() == '.' || token.find('/') != std::string::npos) {
      paths.push_back(token);
    }
  }
  return paths;
}

} // namespace hostgate::security
