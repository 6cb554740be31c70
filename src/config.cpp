#include "config.hpp"

#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace pcli2mcp {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static bool TryParseInt(const std::string& s, long long* out) {
  if (s.empty() || !out) return false;
  char* end = nullptr;
  long long n = std::strtoll(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  *out = n;
  return true;
}

static void ReadPositiveSize(const char* name, size_t* out) {
  long long n = 0;
  if (TryParseInt(GetEnvStr(name), &n) && n > 0) *out = static_cast<size_t>(n);
}

static bool IsValidPort(long long n) {
  return n > 0 && n <= 65535;
}

}  // namespace

GatewayConfig LoadConfigFromEnv() {
  GatewayConfig cfg;
  long long n = 0;

  if (auto host = GetEnvStr("PCLI2_MCP_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (TryParseInt(GetEnvStr("PCLI2_MCP_LISTEN_PORT"), &n) && IsValidPort(n)) cfg.listen.port = static_cast<int>(n);

  if (auto program = GetEnvStr("PCLI2_MCP_PROGRAM"); !program.empty()) cfg.program = program;

  ReadPositiveSize("PCLI2_MCP_MAX_BODY_BYTES", &cfg.max_body_bytes);
  ReadPositiveSize("PCLI2_MCP_MAX_OUTPUT_BYTES", &cfg.max_output_bytes);
  if (TryParseInt(GetEnvStr("PCLI2_MCP_TIMEOUT_S"), &n) && n > 0 && n <= INT32_MAX) {
    cfg.timeout_seconds = static_cast<int>(n);
  }
  if (TryParseInt(GetEnvStr("PCLI2_MCP_MAX_IN_FLIGHT"), &n) && n >= 0 && n <= INT32_MAX) {
    cfg.max_in_flight = static_cast<int>(n);
  }

  if (auto v = GetEnvStr("PCLI2_MCP_INLINE_IMAGES"); !v.empty()) {
    bool b = false;
    if (TryParseBool(v, &b)) cfg.inline_images = b;
  }
  if (auto v = GetEnvStr("PCLI2_MCP_VERBOSE"); !v.empty()) {
    bool b = false;
    if (TryParseBool(v, &b)) cfg.verbose = b;
  }

  return cfg;
}

size_t HttpWorkerThreads(const GatewayConfig& cfg) {
  constexpr size_t kSpareWorkers = 8;
  constexpr size_t kUnboundedWorkers = 64;
  if (cfg.max_in_flight <= 0) return kUnboundedWorkers;
  return static_cast<size_t>(cfg.max_in_flight) + kSpareWorkers;
}

bool ApplyCommandLine(const std::vector<std::string>& args,
                      GatewayConfig* cfg,
                      CommandLineOptions* opts,
                      std::string* err) {
  auto need_value = [&](size_t i, const std::string& flag) -> bool {
    if (i + 1 < args.size()) return true;
    if (err) *err = "missing value for " + flag;
    return false;
  };

  for (size_t i = 0; i < args.size(); i++) {
    const auto& a = args[i];
    long long n = 0;
    if (a == "--help" || a == "-h") {
      opts->help = true;
    } else if (a == "--print-config") {
      opts->print_config = true;
    } else if (a == "--verbose" || a == "-v") {
      cfg->verbose = true;
    } else if (a == "--host") {
      if (!need_value(i, a)) return false;
      cfg->listen.host = args[++i];
    } else if (a == "--port") {
      if (!need_value(i, a)) return false;
      if (!TryParseInt(args[++i], &n) || !IsValidPort(n)) {
        if (err) *err = "invalid port: " + args[i];
        return false;
      }
      cfg->listen.port = static_cast<int>(n);
    } else if (a == "--program") {
      if (!need_value(i, a)) return false;
      cfg->program = args[++i];
    } else if (a == "--timeout") {
      if (!need_value(i, a)) return false;
      if (!TryParseInt(args[++i], &n) || n <= 0 || n > INT32_MAX) {
        if (err) *err = "invalid timeout: " + args[i];
        return false;
      }
      cfg->timeout_seconds = static_cast<int>(n);
    } else {
      if (err) *err = "unknown argument: " + a;
      return false;
    }
  }
  return true;
}

std::string Usage(const std::string& argv0) {
  std::ostringstream oss;
  oss << "usage: " << argv0 << " [options]\n"
      << "  --host HOST        listen address (PCLI2_MCP_LISTEN_HOST, default 127.0.0.1)\n"
      << "  --port PORT        listen port (PCLI2_MCP_LISTEN_PORT, default 8080)\n"
      << "  --program PATH     pcli2 executable (PCLI2_MCP_PROGRAM, default pcli2)\n"
      << "  --timeout SECONDS  per-call wall clock limit (PCLI2_MCP_TIMEOUT_S, default 120)\n"
      << "  --verbose          log request bodies (PCLI2_MCP_VERBOSE)\n"
      << "  --print-config     print an MCP client configuration snippet and exit\n"
      << "  --help             show this message\n";
  return oss.str();
}

}  // namespace pcli2mcp
