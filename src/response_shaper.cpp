#include "response_shaper.hpp"

#include "request_validator.hpp"

#include <sstream>
#include <string>

namespace pcli2mcp {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string FormatSeconds(std::chrono::milliseconds d) {
  std::ostringstream oss;
  if (d.count() % 1000 == 0) {
    oss << d.count() / 1000 << "s";
  } else {
    oss << static_cast<double>(d.count()) / 1000.0 << "s";
  }
  return oss.str();
}

static std::string ProgramLabel(const Invocation& inv) {
  if (inv.argv.empty()) return "command";
  const auto& p = inv.Program();
  auto slash = p.rfind('/');
  return slash == std::string::npos ? p : p.substr(slash + 1);
}

// Drops a multi-byte sequence that the output cap cut in half.
static std::string TrimPartialUtf8Tail(std::string s) {
  size_t i = s.size();
  size_t continuation = 0;
  while (i > 0 && continuation < 3 && (static_cast<unsigned char>(s[i - 1]) & 0xC0) == 0x80) {
    i--;
    continuation++;
  }
  if (i == 0) return s;
  const auto lead = static_cast<unsigned char>(s[i - 1]);
  size_t need = 0;
  if ((lead & 0xE0) == 0xC0) {
    need = 2;
  } else if ((lead & 0xF0) == 0xE0) {
    need = 3;
  } else if ((lead & 0xF8) == 0xF0) {
    need = 4;
  } else {
    return s;
  }
  if (continuation + 1 < need) s.resize(i - 1);
  return s;
}

static std::string StreamText(const std::string& data, bool truncated) {
  return ToValidUtf8(truncated ? TrimPartialUtf8Tail(data) : data);
}

static void AppendStreams(const ExecutionResult& r, bool always_stderr, size_t cap, std::ostringstream* oss) {
  if (always_stderr || !r.stderr_data.empty()) {
    *oss << "\nStderr:\n" << (r.stderr_data.empty() ? "(empty)" : StreamText(r.stderr_data, r.stderr_truncated));
  }
  if (!r.stdout_data.empty()) *oss << "\nStdout:\n" << StreamText(r.stdout_data, r.stdout_truncated);
  if (r.stdout_truncated) *oss << "\n[stdout truncated at " << cap << " bytes]";
  if (r.stderr_truncated) *oss << "\n[stderr truncated at " << cap << " bytes]";
}

static McpToolResult ErrorResult(const std::string& kind, const Invocation& inv, const std::string& text) {
  McpToolResult out;
  out.is_error = true;
  out.AddText(ToValidUtf8(text));
  out.meta["errorCode"] = rpc_error::kExecutionFailed;
  out.meta["errorKind"] = kind;
  out.meta["command"] = ToValidUtf8(RenderCommandLine(inv));
  return out;
}

static McpToolResult ShapeImage(const Invocation& inv, const ExecutionResult& r, const ShaperOptions& opts) {
  if (r.stdout_truncated) {
    std::ostringstream oss;
    oss << ProgramLabel(inv) << " produced an image larger than " << opts.max_output_bytes << " bytes\n"
        << "Command: " << RenderCommandLine(inv);
    return ErrorResult("truncated", inv, oss.str());
  }
  if (r.stdout_data.empty()) {
    std::ostringstream oss;
    oss << ProgramLabel(inv) << " produced no image data\n"
        << "Command: " << RenderCommandLine(inv);
    AppendStreams(r, false, opts.max_output_bytes, &oss);
    return ErrorResult("empty", inv, oss.str());
  }

  McpToolResult out;
  const auto mime = SniffImageMimeType(r.stdout_data);
  const auto data = Base64Encode(r.stdout_data);
  if (!mime.empty() && opts.inline_images) {
    out.content.push_back({{"type", "image"}, {"data", data}, {"mimeType", mime}});
  } else {
    const std::string declared = mime.empty() ? "application/octet-stream" : mime;
    out.AddText("data:" + declared + ";base64," + data);
  }
  out.meta["mimeType"] = mime.empty() ? nlohmann::json(nullptr) : nlohmann::json(mime);
  out.meta["bytes"] = r.stdout_data.size();
  return out;
}

}  // namespace

nlohmann::json McpToolResult::ToJson() const {
  nlohmann::json j;
  j["content"] = content;
  j["isError"] = is_error;
  if (!meta.empty()) j["_meta"] = meta;
  return j;
}

void McpToolResult::AddText(const std::string& text) {
  content.push_back({{"type", "text"}, {"text", text}});
}

std::string ToValidUtf8(const std::string& bytes) {
  const auto quoted = nlohmann::json(bytes).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return nlohmann::json::parse(quoted).get<std::string>();
}

std::string Base64Encode(const std::string& bytes) {
  static const char kChars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((bytes.size() + 2) / 3) * 4);
  int val = 0;
  int valb = -6;
  for (unsigned char c : bytes) {
    val = ((val << 8) + c) & 0xFFFFFF;
    valb += 8;
    while (valb >= 0) {
      out.push_back(kChars[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) out.push_back(kChars[((val << 8) >> (valb + 8)) & 0x3F]);
  while (out.size() % 4) out.push_back('=');
  return out;
}

std::string SniffImageMimeType(const std::string& bytes) {
  if (StartsWith(bytes, std::string("\x89PNG\r\n\x1a\n", 8))) return "image/png";
  if (StartsWith(bytes, std::string("\xFF\xD8\xFF", 3))) return "image/jpeg";
  if (StartsWith(bytes, "GIF87a") || StartsWith(bytes, "GIF89a")) return "image/gif";
  if (bytes.size() >= 12 && StartsWith(bytes, "RIFF") && bytes.compare(8, 4, "WEBP") == 0) return "image/webp";
  if (StartsWith(bytes, "BM") && bytes.size() >= 14) return "image/bmp";
  return {};
}

std::string EffectiveFormat(const ToolDefinition& tool, const ToolCallArguments& args) {
  auto fmt = args.GetString("format");
  if (!fmt.empty()) return fmt;
  return tool.output == OutputKind::kImage ? "image" : "text";
}

McpToolResult ShapeExecution(const ToolDefinition& tool,
                             const Invocation& inv,
                             const ExecutionResult& result,
                             const std::string& format,
                             const ShaperOptions& opts) {
  const auto label = ProgramLabel(inv);

  if (result.timed_out) {
    std::ostringstream oss;
    oss << label << " timed out after " << FormatSeconds(opts.timeout) << " and was terminated\n"
        << "Command: " << RenderCommandLine(inv);
    AppendStreams(result, false, opts.max_output_bytes, &oss);
    auto out = ErrorResult("timeout", inv, oss.str());
    out.meta["timeoutMs"] = opts.timeout.count();
    return out;
  }

  if (result.exit_code == kExitTerminated) {
    std::ostringstream oss;
    oss << label << " was terminated by signal " << result.term_signal << "\n"
        << "Command: " << RenderCommandLine(inv);
    AppendStreams(result, true, opts.max_output_bytes, &oss);
    auto out = ErrorResult("signal", inv, oss.str());
    out.meta["signal"] = result.term_signal;
    return out;
  }

  if (result.exit_code != 0) {
    std::ostringstream oss;
    oss << label << " exited with code " << result.exit_code << "\n"
        << "Command: " << RenderCommandLine(inv);
    AppendStreams(result, true, opts.max_output_bytes, &oss);
    auto out = ErrorResult("exit", inv, oss.str());
    out.meta["exitCode"] = result.exit_code;
    return out;
  }

  if (tool.output == OutputKind::kImage) {
    auto out = ShapeImage(inv, result, opts);
    out.meta["format"] = format;
    return out;
  }

  McpToolResult out;
  out.content.push_back({{"type", "text"},
                         {"text", StreamText(result.stdout_data, result.stdout_truncated)},
                         {"_meta", {{"format", format}}}});
  if (result.stdout_truncated) {
    out.AddText("[output truncated at " + std::to_string(opts.max_output_bytes) + " bytes]");
  }
  out.meta["format"] = format;
  out.meta["exitCode"] = 0;
  out.meta["truncated"] = result.stdout_truncated;
  return out;
}

McpToolResult ShapeSpawnError(const Invocation& inv, const std::string& err) {
  std::ostringstream oss;
  oss << "failed to start " << ProgramLabel(inv) << ": " << err << "\n"
      << "Command: " << RenderCommandLine(inv);
  return ErrorResult("spawn", inv, oss.str());
}

McpToolResult ShapeBusy(const Invocation& inv, int max_in_flight) {
  std::ostringstream oss;
  oss << "gateway busy: " << max_in_flight << " tool calls already running, retry later\n"
      << "Command: " << RenderCommandLine(inv);
  return ErrorResult("busy", inv, oss.str());
}

}  // namespace pcli2mcp
