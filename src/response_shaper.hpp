#pragma once

#include "command_builder.hpp"
#include "process_runner.hpp"
#include "tool_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace pcli2mcp {

struct ShaperOptions {
  bool inline_images = true;
  std::chrono::milliseconds timeout{120000};
  size_t max_output_bytes = 8 * 1024 * 1024;
};

// The `tools/call` result: {isError, content[], _meta}.
struct McpToolResult {
  bool is_error = false;
  nlohmann::json content = nlohmann::json::array();
  nlohmann::json meta = nlohmann::json::object();

  nlohmann::json ToJson() const;
  void AddText(const std::string& text);
};

// Lossy decode for process output: every invalid UTF-8 sequence becomes
// U+FFFD so the text can always be serialized as a JSON string.
std::string ToValidUtf8(const std::string& bytes);

std::string Base64Encode(const std::string& bytes);

// MIME type from the leading magic bytes (PNG, JPEG, GIF, WebP, BMP); empty
// when unknown.
std::string SniffImageMimeType(const std::string& bytes);

// The format a call runs with: its `format` argument, otherwise "text" for
// text tools and "image" for image tools.
std::string EffectiveFormat(const ToolDefinition& tool, const ToolCallArguments& args);

McpToolResult ShapeExecution(const ToolDefinition& tool,
                             const Invocation& inv,
                             const ExecutionResult& result,
                             const std::string& format,
                             const ShaperOptions& opts);

McpToolResult ShapeSpawnError(const Invocation& inv, const std::string& err);

McpToolResult ShapeBusy(const Invocation& inv, int max_in_flight);

}  // namespace pcli2mcp
