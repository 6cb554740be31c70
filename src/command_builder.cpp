#include "command_builder.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace pcli2mcp {
namespace {

static bool IsShellSafeChar(char ch) {
  if (ch >= 'a' && ch <= 'z') return true;
  if (ch >= 'A' && ch <= 'Z') return true;
  if (ch >= '0' && ch <= '9') return true;
  switch (ch) {
    case '_':
    case '-':
    case '.':
    case '/':
    case ',':
    case ':':
    case '=':
    case '+':
    case '@':
    case '%':
      return true;
    default:
      return false;
  }
}

static void EmitScalar(const ParamSpec& spec, std::string value, std::vector<std::string>* out) {
  if (!spec.flag.empty()) out->push_back(spec.flag);
  out->push_back(std::move(value));
}

}  // namespace

std::vector<std::string> Invocation::Arguments() const {
  if (argv.empty()) return {};
  return std::vector<std::string>(argv.begin() + 1, argv.end());
}

Invocation BuildInvocation(const ToolDefinition& tool, const ToolCallArguments& args) {
  Invocation inv;
  inv.argv.push_back(tool.program);
  inv.argv.insert(inv.argv.end(), tool.subcommand.begin(), tool.subcommand.end());

  for (const auto& spec : tool.params) {
    const ArgValue* v = args.Get(spec.name);
    if (!v) continue;
    std::visit(
        [&](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, bool>) {
            if (value) inv.argv.push_back(spec.flag);
          } else if constexpr (std::is_same_v<T, double>) {
            EmitScalar(spec, FormatNumber(value, spec.precision), &inv.argv);
          } else if constexpr (std::is_same_v<T, std::string>) {
            EmitScalar(spec, value, &inv.argv);
          } else {
            for (const auto& item : value) EmitScalar(spec, item, &inv.argv);
          }
        },
        *v);
  }
  return inv;
}

std::string FormatNumber(double value, int precision) {
  char buf[64];
  if (precision >= 0) {
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
  }
  if (std::floor(value) == value && std::fabs(value) < 1e15) {
    std::snprintf(buf, sizeof(buf), "%.0f", value);
    return buf;
  }
  std::snprintf(buf, sizeof(buf), "%.17g", value);
  // Prefer the shortest representation that still round-trips.
  for (int p = 1; p <= 17; p++) {
    char shorter[64];
    std::snprintf(shorter, sizeof(shorter), "%.*g", p, value);
    if (std::strtod(shorter, nullptr) == value) return shorter;
  }
  return buf;
}

std::string ShellQuote(const std::string& token) {
  if (token.empty()) return "''";
  bool safe = true;
  for (char ch : token) {
    if (!IsShellSafeChar(ch)) {
      safe = false;
      break;
    }
  }
  if (safe) return token;

  std::string out;
  out.reserve(token.size() + 2);
  out.push_back('\'');
  for (char ch : token) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string ShellJoin(const std::vector<std::string>& tokens) {
  std::string out;
  for (size_t i = 0; i < tokens.size(); i++) {
    if (i) out.push_back(' ');
    out += ShellQuote(tokens[i]);
  }
  return out;
}

std::string RenderCommandLine(const Invocation& inv) {
  return ShellJoin(inv.argv);
}

}  // namespace pcli2mcp
