#include "request_validator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace pcli2mcp {
namespace {

static bool Fail(ValidationError* err, int code, const std::string& field, const std::string& message) {
  if (err) {
    err->code = code;
    err->field = field;
    err->message = message;
  }
  return false;
}

static bool FailEnvelope(EnvelopeError* err, int code, const std::string& message, const nlohmann::json& id) {
  if (err) {
    err->code = code;
    err->message = message;
    err->id = id;
  }
  return false;
}

static std::string Join(const std::vector<std::string>& items, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); i++) {
    if (i) out += sep;
    out += items[i];
  }
  return out;
}

static std::string FormatLimit(double v) {
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

static std::string JsonTypeName(const nlohmann::json& v) {
  if (v.is_null()) return "null";
  if (v.is_boolean()) return "boolean";
  if (v.is_number()) return "number";
  if (v.is_string()) return "string";
  if (v.is_array()) return "array";
  return "object";
}

static bool ConvertValue(const ParamSpec& spec, const nlohmann::json& v, ArgValue* out, ValidationError* err) {
  const auto wrong_type = [&]() {
    return Fail(err, rpc_error::kInvalidParams, spec.name,
                "invalid type for " + spec.name + ": expected " + ParamKindName(spec.kind) + ", got " + JsonTypeName(v));
  };

  switch (spec.kind) {
    case ParamKind::kString: {
      if (!v.is_string()) return wrong_type();
      auto s = v.get<std::string>();
      if (s.empty() && !spec.allow_empty) {
        return Fail(err, rpc_error::kInvalidParams, spec.name, spec.name + " must not be empty");
      }
      *out = std::move(s);
      return true;
    }
    case ParamKind::kNumber: {
      if (!v.is_number()) return wrong_type();
      const double d = v.get<double>();
      if (!std::isfinite(d)) return Fail(err, rpc_error::kInvalidParams, spec.name, spec.name + " must be finite");
      if ((spec.minimum && d < *spec.minimum) || (spec.maximum && d > *spec.maximum)) {
        std::string range = "[" + (spec.minimum ? FormatLimit(*spec.minimum) : std::string("-inf")) + ", " +
                            (spec.maximum ? FormatLimit(*spec.maximum) : std::string("inf")) + "]";
        return Fail(err, rpc_error::kInvalidParams, spec.name,
                    spec.name + " out of range: " + v.dump() + " is not in " + range);
      }
      *out = d;
      return true;
    }
    case ParamKind::kBoolean:
      if (!v.is_boolean()) return wrong_type();
      *out = v.get<bool>();
      return true;
    case ParamKind::kEnum: {
      if (!v.is_string()) return wrong_type();
      auto s = v.get<std::string>();
      if (std::find(spec.enum_values.begin(), spec.enum_values.end(), s) == spec.enum_values.end()) {
        return Fail(err, rpc_error::kInvalidParams, spec.name,
                    "invalid value for " + spec.name + ": \"" + s + "\" (expected one of: " +
                        Join(spec.enum_values, ", ") + ")");
      }
      *out = std::move(s);
      return true;
    }
    case ParamKind::kStringList: {
      if (!v.is_array()) return wrong_type();
      std::vector<std::string> items;
      items.reserve(v.size());
      for (size_t i = 0; i < v.size(); i++) {
        if (!v[i].is_string() || v[i].get<std::string>().empty()) {
          return Fail(err, rpc_error::kInvalidParams, spec.name,
                      spec.name + "[" + std::to_string(i) + "] must be a non-empty string");
        }
        items.push_back(v[i].get<std::string>());
      }
      *out = std::move(items);
      return true;
    }
  }
  return wrong_type();
}

}  // namespace

std::optional<JsonRpcRequest> ValidateEnvelope(const std::string& raw, size_t max_body_bytes, EnvelopeError* err) {
  const nlohmann::json null_id;
  if (max_body_bytes > 0 && raw.size() > max_body_bytes) {
    FailEnvelope(err, rpc_error::kInvalidRequest,
                 "request body exceeds " + std::to_string(max_body_bytes) + " bytes", null_id);
    return std::nullopt;
  }

  auto j = nlohmann::json::parse(raw, nullptr, false);
  if (j.is_discarded()) {
    FailEnvelope(err, rpc_error::kParseError, "parse error: invalid json", null_id);
    return std::nullopt;
  }
  if (j.is_array()) {
    FailEnvelope(err, rpc_error::kInvalidRequest, "batch requests are not supported", null_id);
    return std::nullopt;
  }
  if (!j.is_object()) {
    FailEnvelope(err, rpc_error::kInvalidRequest, "request must be a json object", null_id);
    return std::nullopt;
  }

  JsonRpcRequest req;
  if (j.contains("id")) {
    const auto& id = j["id"];
    if (!id.is_string() && !id.is_number() && !id.is_null()) {
      FailEnvelope(err, rpc_error::kInvalidRequest, "invalid id: must be a string, number or null", null_id);
      return std::nullopt;
    }
    req.has_id = true;
    req.id = id;
  }

  if (!j.contains("jsonrpc") || !j["jsonrpc"].is_string() || j["jsonrpc"].get<std::string>() != "2.0") {
    FailEnvelope(err, rpc_error::kInvalidRequest, "invalid jsonrpc version: expected \"2.0\"", req.id);
    return std::nullopt;
  }
  if (!j.contains("method") || !j["method"].is_string() || j["method"].get<std::string>().empty()) {
    FailEnvelope(err, rpc_error::kInvalidRequest, "missing field: method", req.id);
    return std::nullopt;
  }
  req.method = j["method"].get<std::string>();

  if (j.contains("params") && !j["params"].is_null()) {
    if (!j["params"].is_object()) {
      FailEnvelope(err, rpc_error::kInvalidRequest, "params must be an object", req.id);
      return std::nullopt;
    }
    req.params = j["params"];
  }
  return req;
}

const ArgValue* ToolCallArguments::Get(const std::string& name) const {
  auto it = values.find(name);
  if (it == values.end()) return nullptr;
  return &it->second;
}

std::string ToolCallArguments::GetString(const std::string& name, const std::string& fallback) const {
  const auto* v = Get(name);
  if (!v) return fallback;
  if (const auto* s = std::get_if<std::string>(v)) return *s;
  return fallback;
}

std::optional<ToolCallArguments> ValidateToolCall(const ToolRegistry& registry,
                                                  const std::string& name,
                                                  const nlohmann::json& args,
                                                  ValidationError* err) {
  const ToolDefinition* tool = registry.Find(name);
  if (!tool) {
    Fail(err, rpc_error::kToolNotFound, "name", "unknown tool: " + name);
    return std::nullopt;
  }

  const nlohmann::json empty = nlohmann::json::object();
  const nlohmann::json& a = args.is_null() ? empty : args;
  if (!a.is_object()) {
    Fail(err, rpc_error::kInvalidParams, "arguments", "arguments must be an object");
    return std::nullopt;
  }

  for (const auto& item : a.items()) {
    if (!tool->HasParam(item.key())) {
      Fail(err, rpc_error::kInvalidParams, item.key(), "unknown argument for " + tool->name + ": " + item.key());
      return std::nullopt;
    }
  }

  ToolCallArguments out;
  out.tool = tool;
  for (const auto& spec : tool->params) {
    auto it = a.find(spec.name);
    if (it == a.end() || it->is_null()) {
      if (spec.required) {
        Fail(err, rpc_error::kInvalidParams, spec.name, "missing required field: " + spec.name);
        return std::nullopt;
      }
      if (spec.default_value.is_null()) continue;
      ArgValue def;
      if (!ConvertValue(spec, spec.default_value, &def, err)) return std::nullopt;
      out.values.emplace(spec.name, std::move(def));
      continue;
    }
    ArgValue v;
    if (!ConvertValue(spec, *it, &v, err)) return std::nullopt;
    out.values.emplace(spec.name, std::move(v));
  }

  for (const auto& group : tool->at_least_one_of) {
    const bool any = std::any_of(group.begin(), group.end(), [&](const std::string& n) { return out.Has(n); });
    if (!any) {
      Fail(err, rpc_error::kInvalidParams, Join(group, "|"), "at least one of " + Join(group, ", ") + " is required");
      return std::nullopt;
    }
  }
  return out;
}

std::optional<ToolCallArguments> ValidateToolCallParams(const ToolRegistry& registry,
                                                        const nlohmann::json& params,
                                                        ValidationError* err) {
  if (!params.is_object() || !params.contains("name") || !params["name"].is_string() ||
      params["name"].get<std::string>().empty()) {
    Fail(err, rpc_error::kInvalidParams, "name", "missing field: params.name");
    return std::nullopt;
  }
  nlohmann::json args;
  if (params.contains("arguments")) args = params["arguments"];
  return ValidateToolCall(registry, params["name"].get<std::string>(), args, err);
}

}  // namespace pcli2mcp
