#include "hostgate/tools/tool_parser.hpp"

#include "hostgate/common/fs.hpp"

#include <algorithm>
#include <fstream>

namespace hostgate::tools {

namespace {

using common::ErrorKind;

// Per-language header layout. Every variant stops at `max_lines`, at a
// "---" separator comment, or at the first line of code.
struct HeaderSyntax {
  std::string extension;
  std::string comment_prefix;
  std::size_t max_lines = 50;
  // Go headers precede the package clause; non-comment lines above it are
  // tolerated (build tags, blank lines).
  std::string terminator;
  bool sections = true;
};

const std::vector<HeaderSyntax> &header_syntaxes() {
  static const std::vector<HeaderSyntax> syntaxes = {
      HeaderSyntax{.extension = ".sh", .comment_prefix = "#", .max_lines = 50},
      HeaderSyntax{.extension = ".py", .comment_prefix = "#", .max_lines = 30, .sections = false},
      HeaderSyntax{.extension = ".go",
                   .comment_prefix = "//",
                   .max_lines = 100,
                   .terminator = "package "},
  };
  return syntaxes;
}

const HeaderSyntax *find_syntax(const std::string &extension) {
  for (const auto &syntax : header_syntaxes()) {
    if (syntax.extension == extension) {
      return &syntax;
    }
  }
  return nullptr;
}

bool is_allowed(const std::vector<std::string> &allowed, const std::string &extension) {
  return std::find(allowed.begin(), allowed.end(), extension) != allowed.end();
}

enum class Section { None, Usage, Examples };

} // namespace

common::Status validate_tool_name(const std::string &name) {
  if (name.empty()) {
    return common::Status::error("empty tool name", ErrorKind::InvalidArgument);
  }
  if (name.find('/') != std::string::npos || name.find("..") != std::string::npos) {
    return common::Status::error("invalid tool name (path traversal): " + name,
                                 ErrorKind::InvalidArgument);
  }
  return common::Status::success();
}

std::string tool_extension(const std::string &name) {
  const auto dot = name.rfind('.');
  if (dot == std::string::npos) {
    return "";
  }
  return name.substr(dot);
}

common::Result<ToolInfo> parse_tool_header(const std::filesystem::path &path) {
  const std::string name = path.filename().string();
  const std::string extension = tool_extension(name);
  const HeaderSyntax *syntax = find_syntax(extension);
  if (syntax == nullptr) {
    return common::Result<ToolInfo>::failure("unsupported extension: " + extension,
                                             ErrorKind::ParseError);
  }

  std::ifstream in(path);
  if (!in) {
    return common::Result<ToolInfo>::failure("unable to read tool: " + path.string(),
                                             ErrorKind::NotFound);
  }

  ToolInfo info{.name = name, .extension = extension};
  std::vector<std::string> usage;
  Section section = Section::None;
  std::string line;
  std::size_t line_number = 0;

  while (std::getline(in, line)) {
    ++line_number;
    if (line_number > syntax->max_lines) {
      break;
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line_number == 1 && common::starts_with(line, "#!")) {
      continue;
    }
    if (!syntax->terminator.empty() && common::starts_with(line, syntax->terminator)) {
      break;
    }
    if (!common::starts_with(line, syntax->comment_prefix)) {
      // Go tolerates code-free lines before the package clause; scripts end
      // their header at the first non-comment line.
      if (!syntax->terminator.empty() || (!syntax->sections && common::trim(line).empty())) {
        continue;
      }
      break;
    }

    const std::string content = common::trim(line.substr(syntax->comment_prefix.size()));
    if (common::starts_with(content, "---")) {
      break;
    }
    if (!syntax->sections) {
      // Python headers carry a one-line description only.
      if (content.empty() || content.find("coding:") != std::string::npos ||
          content.find("coding=") != std::string::npos) {
        continue;
      }
      info.description = content;
      break;
    }

    if (info.description.empty() && !content.empty()) {
      // A leading "# name.sh" line repeats the file name; skip it.
      if (content == name || common::ends_with(content, extension)) {
        continue;
      }
      info.description = content;
      continue;
    }
    if (common::starts_with(content, "Usage:")) {
      section = Section::Usage;
      const std::string inline_usage = common::trim(content.substr(6));
      if (!inline_usage.empty()) {
        usage.push_back(inline_usage);
      }
      continue;
    }
    if (common::starts_with(content, "Examples:")) {
      section = Section::Examples;
      continue;
    }
    if (content.empty()) {
      continue;
    }
    if (section == Section::Usage) {
      usage.push_back(content);
    } else if (section == Section::Examples) {
      info.examples.push_back(content);
    }
  }

  info.usage = common::join(usage, "\n");
  return common::Result<ToolInfo>::success(std::move(info));
}

common::Result<std::vector<ToolInfo>>
list_tools_in_dir(const std::filesystem::path &dir,
                  const std::vector<std::string> &allowed_extensions) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return common::Result<std::vector<ToolInfo>>::failure(
        "reading directory " + dir.string() + ": " + ec.message(), ErrorKind::NotFound);
  }

  std::vector<ToolInfo> tools;
  for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    if (!it->is_regular_file(ec)) {
      continue;
    }
    const std::string name = it->path().filename().string();
    if (common::starts_with(name, "_") || !is_allowed(allowed_extensions, tool_extension(name))) {
      continue;
    }
    auto info = parse_tool_header(it->path());
    if (!info.ok()) {
      continue;
    }
    tools.push_back(std::move(info.value()));
  }

  std::sort(tools.begin(), tools.end(),
            [](const ToolInfo &a, const ToolInfo &b) { return a.name < b.name; });
  return common::Result<std::vector<ToolInfo>>::success(std::move(tools));
}

common::Result<ToolInfo> get_tool_info(const std::filesystem::path &dir, const std::string &name,
                                       const std::vector<std::string> &allowed_extensions) {
  if (auto status = validate_tool_name(name); !status.ok()) {
    return common::Result<ToolInfo>::failure(status.error(), status.kind());
  }
  const std::string extension = tool_extension(name);
  if (!is_allowed(allowed_extensions, extension)) {
    return common::Result<ToolInfo>::failure("extension not allowed: " + extension,
                                             ErrorKind::InvalidArgument);
  }
  const auto path = dir / name;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Result<ToolInfo>::failure("tool not found: " + name, ErrorKind::NotFound);
  }
  return parse_tool_header(path);
}

} // namespace hostgate::tools
