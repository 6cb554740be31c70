#include "mcp_dispatcher.hpp"

#include "command_builder.hpp"

#include <cstring>
#include <iostream>
#include <string>
#include <utility>

namespace pcli2mcp {
namespace {

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static std::string IdForLog(const JsonRpcRequest& req) {
  return req.has_id ? req.id.dump() : "-";
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static bool IsSupportedProtocolVersion(const std::string& v) {
  return v == "2024-11-05" || v == "2025-03-26" || v == "2025-06-18";
}

static void LogToolResult(const std::string& tool, const ExecutionResult& r) {
  std::cout << "[tool-result] tool=" << tool << " exit=" << r.exit_code << " signal=" << r.term_signal
            << " timed_out=" << (r.timed_out ? 1 : 0) << " truncated=" << (r.Truncated() ? 1 : 0)
            << " stdout_bytes=" << r.stdout_data.size() << " stderr_bytes=" << r.stderr_data.size()
            << " ms=" << r.elapsed.count() << "\n";
}

}  // namespace

nlohmann::json MakeRpcResult(const nlohmann::json& id, nlohmann::json result) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["result"] = std::move(result);
  return j;
}

nlohmann::json MakeRpcError(const nlohmann::json& id, int code, const std::string& message, const nlohmann::json& data) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["error"] = {{"code", code}, {"message", message}};
  if (!data.is_null()) j["error"]["data"] = data;
  return j;
}

McpDispatcher::McpDispatcher(const ToolRegistry* tools, DispatcherOptions opts) : tools_(tools), opts_(std::move(opts)) {}

std::optional<nlohmann::json> McpDispatcher::HandleBody(const std::string& body) {
  EnvelopeError env_err;
  auto req = ValidateEnvelope(body, opts_.max_body_bytes, &env_err);
  if (!req) {
    std::cout << "[mcp] rejected code=" << env_err.code << " error=" << env_err.message << "\n";
    return MakeRpcError(env_err.id, env_err.code, env_err.message);
  }
  return Handle(*req);
}

std::optional<nlohmann::json> McpDispatcher::Handle(const JsonRpcRequest& req) {
  std::cout << "[mcp] method=" << req.method << " id=" << IdForLog(req) << "\n";
  if (opts_.verbose) std::cout << "[mcp] params=" << TruncateForLog(req.params.dump(), 2000) << "\n";

  if (req.IsNotification()) {
    std::cout << "[mcp] notification method=" << req.method << " (no response)\n";
    return std::nullopt;
  }

  if (req.method == "initialize") return MakeRpcResult(req.id, HandleInitialize(req));
  if (req.method == "ping") return MakeRpcResult(req.id, nlohmann::json::object());
  if (req.method == "tools/list") {
    nlohmann::json result;
    result["tools"] = tools_->ToMcpToolList();
    return MakeRpcResult(req.id, std::move(result));
  }
  if (req.method == "tools/call") return HandleToolsCall(req);

  return MakeRpcError(req.id, rpc_error::kMethodNotFound, "method not found: " + req.method,
                      {{"method", req.method}});
}

nlohmann::json McpDispatcher::HandleInitialize(const JsonRpcRequest& req) const {
  std::string version = kLatestProtocolVersion;
  if (req.params.contains("protocolVersion") && req.params["protocolVersion"].is_string()) {
    auto requested = req.params["protocolVersion"].get<std::string>();
    if (IsSupportedProtocolVersion(requested)) version = requested;
  }

  nlohmann::json result;
  result["protocolVersion"] = version;
  result["serverInfo"] = {{"name", kServerName}, {"version", kServerVersion}};
  result["capabilities"] = {{"tools", {{"listChanged", false}}}};
  result["instructions"] =
      "Tools run the pcli2 command line against the Physna platform. Identify assets and folders by "
      "uuid or path; list and match tools accept format=json|csv.";
  return result;
}

nlohmann::json McpDispatcher::HandleToolsCall(const JsonRpcRequest& req) {
  ValidationError verr;
  auto args = ValidateToolCallParams(*tools_, req.params, &verr);
  if (!args) {
    std::cout << "[mcp] invalid tools/call id=" << IdForLog(req) << " field=" << verr.field
              << " error=" << verr.message << "\n";
    nlohmann::json data;
    if (verr.code == rpc_error::kToolNotFound) {
      data = {{"tool", req.params.value("name", "")}};
    } else {
      data = {{"field", verr.field}};
    }
    return MakeRpcError(req.id, verr.code, verr.message, data);
  }
  return MakeRpcResult(req.id, Execute(*args).ToJson());
}

McpToolResult McpDispatcher::Execute(const ToolCallArguments& args) {
  const ToolDefinition& tool = *args.tool;
  const Invocation inv = BuildInvocation(tool, args);
  const std::string format = EffectiveFormat(tool, args);
  std::cout << "[tool-call] tool=" << tool.name << " argv=" << TruncateForLog(RenderCommandLine(inv), 2000) << "\n";

  if (!TryAcquireSlot()) {
    std::cout << "[tool-result] tool=" << tool.name << " busy in_flight_limit=" << opts_.max_in_flight << "\n";
    return ShapeBusy(inv, opts_.max_in_flight);
  }

  struct SlotRelease {
    McpDispatcher* d;
    ~SlotRelease() { d->ReleaseSlot(); }
  };
  std::optional<ExecutionResult> result;
  std::string spawn_err;
  {
    SlotRelease release{this};
    result = RunProcess(inv.argv, opts_.limits, &spawn_err);
  }

  if (!result) {
    std::cout << "[tool-result] tool=" << tool.name << " spawn_error=" << spawn_err << "\n";
    return ShapeSpawnError(inv, spawn_err);
  }
  LogToolResult(tool.name, *result);

  ShaperOptions shaper;
  shaper.inline_images = opts_.inline_images;
  shaper.timeout = opts_.limits.wall_clock;
  shaper.max_output_bytes = opts_.limits.max_output_bytes;
  return ShapeExecution(tool, inv, *result, format, shaper);
}

bool McpDispatcher::TryAcquireSlot() {
  std::lock_guard<std::mutex> lock(mu_);
  if (opts_.max_in_flight > 0 && in_flight_ >= opts_.max_in_flight) return false;
  in_flight_++;
  return true;
}

void McpDispatcher::ReleaseSlot() {
  std::lock_guard<std::mutex> lock(mu_);
  in_flight_--;
}

void McpDispatcher::Register(httplib::Server* server, const std::string& path) {
  server->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
    std::cout << "[request] " << req.method << " " << req.path << " bytes=" << req.body.size() << "\n";
    if (opts_.verbose) std::cout << "[request] body=" << TruncateForLog(req.body, 2000) << "\n";
    auto out = HandleBody(req.body);
    if (!out) {
      res.status = 202;
      return;
    }
    SendJson(&res, 200, *out);
  });

  server->Get(path, [](const httplib::Request&, httplib::Response& res) {
    res.set_header("Allow", "POST");
    SendJson(&res, 405, MakeRpcError(nullptr, rpc_error::kInvalidRequest, "use POST for JSON-RPC requests"));
  });
}

}  // namespace pcli2mcp
