#include "config.hpp"
#include "mcp_dispatcher.hpp"
#include "request_validator.hpp"
#include "tool_registry.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

static nlohmann::json ClientConfigSnippet(const pcli2mcp::GatewayConfig& cfg) {
  const std::string host = (cfg.listen.host == "0.0.0.0" || cfg.listen.host == "::") ? "127.0.0.1" : cfg.listen.host;
  nlohmann::json j;
  j["mcpServers"]["pcli2"] = {{"type", "http"},
                              {"url", "http://" + host + ":" + std::to_string(cfg.listen.port) + "/mcp"}};
  return j;
}

}  // namespace

int main(int argc, char** argv) {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = pcli2mcp::LoadConfigFromEnv();

  pcli2mcp::CommandLineOptions opts;
  std::string err;
  std::vector<std::string> args(argv + 1, argv + argc);
  if (!pcli2mcp::ApplyCommandLine(args, &cfg, &opts, &err)) {
    std::cerr << err << "\n" << pcli2mcp::Usage(argv[0]);
    return 2;
  }
  if (opts.help) {
    std::cout << pcli2mcp::Usage(argv[0]);
    return 0;
  }
  if (opts.print_config) {
    std::cout << ClientConfigSnippet(cfg).dump(2) << "\n";
    return 0;
  }

  const auto registry = pcli2mcp::BuildPcli2ToolRegistry(cfg.program);

  pcli2mcp::DispatcherOptions dopts;
  dopts.max_body_bytes = cfg.max_body_bytes;
  dopts.limits.wall_clock = std::chrono::seconds(cfg.timeout_seconds);
  dopts.limits.max_output_bytes = cfg.max_output_bytes;
  dopts.inline_images = cfg.inline_images;
  dopts.max_in_flight = cfg.max_in_flight;
  dopts.verbose = cfg.verbose;
  pcli2mcp::McpDispatcher dispatcher(&registry, dopts);

  std::cout << "[gateway] " << pcli2mcp::kServerName << " " << pcli2mcp::kServerVersion << " program=" << cfg.program
            << " tools=" << registry.Size() << "\n";
  std::cout << "[gateway] timeout_s=" << cfg.timeout_seconds << " max_output_bytes=" << cfg.max_output_bytes
            << " max_body_bytes=" << cfg.max_body_bytes << " max_in_flight=" << cfg.max_in_flight
            << " inline_images=" << (cfg.inline_images ? "true" : "false")
            << " http_workers=" << pcli2mcp::HttpWorkerThreads(cfg) << "\n";

  httplib::Server server;
  const size_t workers = pcli2mcp::HttpWorkerThreads(cfg);
  server.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
  dispatcher.Register(&server);

  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    std::cout << "[http] handler exception: " << message << "\n";
    auto j = pcli2mcp::MakeRpcError(nullptr, pcli2mcp::rpc_error::kInternalError, "internal error: " + message);
    res.status = 500;
    res.set_content(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty() || res.status == 202) return;
    nlohmann::json j;
    j["error"] = {{"message", res.status == 404 ? "not found" : "bad request"}, {"status", res.status}};
    res.set_content(j.dump(), "application/json");
  });

  // Whole-body cap above the JSON-RPC limit so oversized requests still get
  // a JSON-RPC error instead of a bare 413.
  server.set_payload_max_length(cfg.max_body_bytes * 2);
  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(cfg.timeout_seconds + 30);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["tools"] = registry.Size();
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  return ok ? 0 : 1;
}
