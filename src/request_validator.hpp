#pragma once

#include "tool_registry.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pcli2mcp {

namespace rpc_error {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kToolNotFound = -32002;
constexpr int kExecutionFailed = -32003;
}  // namespace rpc_error

struct JsonRpcRequest {
  bool has_id = false;
  nlohmann::json id;  // string, number or null; meaningful only when has_id
  std::string method;
  nlohmann::json params = nlohmann::json::object();

  bool IsNotification() const { return !has_id; }
};

struct EnvelopeError {
  int code = rpc_error::kInvalidRequest;
  std::string message;
  nlohmann::json id;  // null unless a valid id was extracted before the failure
};

// Rejects oversized bodies before parsing, then malformed JSON, batches, and
// envelopes with a bad `jsonrpc`, `method`, `id` or `params`.
std::optional<JsonRpcRequest> ValidateEnvelope(const std::string& raw, size_t max_body_bytes, EnvelopeError* err);

using ArgValue = std::variant<std::string, double, bool, std::vector<std::string>>;

struct ToolCallArguments {
  const ToolDefinition* tool = nullptr;
  std::map<std::string, ArgValue> values;

  const ArgValue* Get(const std::string& name) const;
  bool Has(const std::string& name) const { return values.count(name) != 0; }
  std::string GetString(const std::string& name, const std::string& fallback = {}) const;
};

struct ValidationError {
  int code = rpc_error::kInvalidParams;
  std::string field;
  std::string message;
};

// Checks `args` against the named tool's schema, applies defaults and
// enforces at-least-one-of groups. Fails on the first violation.
std::optional<ToolCallArguments> ValidateToolCall(const ToolRegistry& registry,
                                                  const std::string& name,
                                                  const nlohmann::json& args,
                                                  ValidationError* err);

// Same as ValidateToolCall, starting from tools/call `params`.
std::optional<ToolCallArguments> ValidateToolCallParams(const ToolRegistry& registry,
                                                        const nlohmann::json& params,
                                                        ValidationError* err);

}  // namespace pcli2mcp
