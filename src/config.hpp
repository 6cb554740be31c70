#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pcli2mcp {

struct HttpListenConfig {
  std::string host = "127.0.0.1";
  int port = 8080;
};

struct GatewayConfig {
  HttpListenConfig listen;
  std::string program = "pcli2";
  size_t max_body_bytes = 1024 * 1024;
  int timeout_seconds = 120;
  size_t max_output_bytes = 8 * 1024 * 1024;
  int max_in_flight = 16;
  bool inline_images = true;
  bool verbose = false;
};

GatewayConfig LoadConfigFromEnv();

// Worker threads for the HTTP server: the in-flight cap plus spare workers
// for /health, tools/list and busy answers (64 when the cap is unbounded).
size_t HttpWorkerThreads(const GatewayConfig& cfg);

struct CommandLineOptions {
  bool print_config = false;
  bool help = false;
};

// Applies --host/--port/--program/--timeout/--verbose on top of cfg. Returns
// false with *err set on an unknown flag or a missing/invalid value.
bool ApplyCommandLine(const std::vector<std::string>& args,
                      GatewayConfig* cfg,
                      CommandLineOptions* opts,
                      std::string* err);

std::string Usage(const std::string& argv0);

}  // namespace pcli2mcp
