#pragma once

#include "process_runner.hpp"
#include "request_validator.hpp"
#include "response_shaper.hpp"
#include "tool_registry.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace pcli2mcp {

constexpr const char* kServerName = "pcli2-mcp";
constexpr const char* kServerVersion = "0.1.0";
constexpr const char* kLatestProtocolVersion = "2025-06-18";

struct DispatcherOptions {
  size_t max_body_bytes = 1024 * 1024;
  ProcessLimits limits;
  bool inline_images = true;
  int max_in_flight = 16;  // 0 = unbounded
  bool verbose = false;
};

nlohmann::json MakeRpcResult(const nlohmann::json& id, nlohmann::json result);
nlohmann::json MakeRpcError(const nlohmann::json& id,
                            int code,
                            const std::string& message,
                            const nlohmann::json& data = nullptr);

class McpDispatcher {
 public:
  McpDispatcher(const ToolRegistry* tools, DispatcherOptions opts);

  // Full JSON-RPC handling of one HTTP body. Returns nullopt for
  // notifications, which get no response body.
  std::optional<nlohmann::json> HandleBody(const std::string& body);
  std::optional<nlohmann::json> Handle(const JsonRpcRequest& req);

  void Register(httplib::Server* server, const std::string& path = "/mcp");

 private:
  nlohmann::json HandleInitialize(const JsonRpcRequest& req) const;
  nlohmann::json HandleToolsCall(const JsonRpcRequest& req);
  McpToolResult Execute(const ToolCallArguments& args);

  bool TryAcquireSlot();
  void ReleaseSlot();

  const ToolRegistry* tools_;
  DispatcherOptions opts_;

  std::mutex mu_;
  int in_flight_ = 0;
};

}  // namespace pcli2mcp
