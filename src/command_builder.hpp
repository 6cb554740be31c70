#pragma once

#include "request_validator.hpp"
#include "tool_registry.hpp"

#include <string>
#include <vector>

namespace pcli2mcp {

// A fully resolved command: argv[0] is the program, the rest are discrete
// argument tokens. Nothing in the pipeline ever hands these to a shell.
struct Invocation {
  std::vector<std::string> argv;

  const std::string& Program() const { return argv.front(); }
  std::vector<std::string> Arguments() const;
};

// Program, subcommand tokens, then each present parameter in declaration
// order according to its flag rule.
Invocation BuildInvocation(const ToolDefinition& tool, const ToolCallArguments& args);

// Formats a number with `precision` fixed decimals (shortest form when < 0).
std::string FormatNumber(double value, int precision);

// POSIX shell quoting of one token; safe tokens are returned unchanged.
std::string ShellQuote(const std::string& token);

// Space-joined, shell-quoted rendering for humans to copy and re-run.
std::string ShellJoin(const std::vector<std::string>& tokens);
std::string RenderCommandLine(const Invocation& inv);

}  // namespace pcli2mcp
