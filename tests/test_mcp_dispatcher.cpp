#include <gtest/gtest.h>
#include "mcp_dispatcher.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace pcli2mcp;

namespace {

// Writes an executable shell script standing in for the real CLI.
std::string WriteMockProgram(const std::string& body) {
  char path[] = "/tmp/pcli2-mock-XXXXXX";
  const int fd = ::mkstemp(path);
  if (fd < 0) return {};
  ::close(fd);
  std::ofstream out(path, std::ios::trunc);
  out << "#!/bin/sh\n" << body << "\n";
  out.close();
  ::chmod(path, 0755);
  return path;
}

nlohmann::json Call(const std::string& tool, const nlohmann::json& args, int id = 1) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"}, {"params", {{"name", tool}, {"arguments", args}}}};
}

}  // namespace

class McpDispatcherTest : public ::testing::Test {
protected:
  void TearDown() override {
    for (const auto& p : scripts_) std::remove(p.c_str());
  }

  std::string Mock(const std::string& body) {
    auto path = WriteMockProgram(body);
    EXPECT_FALSE(path.empty());
    scripts_.push_back(path);
    return path;
  }

  nlohmann::json Send(McpDispatcher& d, const nlohmann::json& request) {
    auto out = d.HandleBody(request.dump());
    EXPECT_TRUE(out.has_value());
    return out ? *out : nlohmann::json();
  }

  DispatcherOptions Options() {
    DispatcherOptions opts;
    opts.limits.wall_clock = std::chrono::seconds(10);
    opts.limits.max_output_bytes = 64 * 1024;
    return opts;
  }

  ToolRegistry registry = BuildPcli2ToolRegistry("pcli2");

private:
  std::vector<std::string> scripts_;
};

TEST_F(McpDispatcherTest, InitializeEchoesSupportedVersion) {
  McpDispatcher d(&registry, Options());
  auto resp = Send(d, {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                       {"params", {{"protocolVersion", "2025-03-26"}}}});
  EXPECT_EQ(resp["id"], 1);
  EXPECT_EQ(resp["result"]["protocolVersion"], "2025-03-26");
  EXPECT_EQ(resp["result"]["serverInfo"]["name"], kServerName);
  EXPECT_TRUE(resp["result"]["capabilities"].contains("tools"));

  auto latest = Send(d, {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "initialize"},
                         {"params", {{"protocolVersion", "1999-01-01"}}}});
  EXPECT_EQ(latest["result"]["protocolVersion"], kLatestProtocolVersion);
}

TEST_F(McpDispatcherTest, ToolsListReturnsRegistry) {
  McpDispatcher d(&registry, Options());
  auto resp = Send(d, {{"jsonrpc", "2.0"}, {"id", "list-1"}, {"method", "tools/list"}});
  EXPECT_EQ(resp["id"], "list-1");
  ASSERT_TRUE(resp["result"]["tools"].is_array());
  EXPECT_EQ(resp["result"]["tools"].size(), registry.Size());
  EXPECT_EQ(resp["result"]["tools"][0]["name"], "pcli2_tenant_list");
}

TEST_F(McpDispatcherTest, PingAndUnknownMethod) {
  McpDispatcher d(&registry, Options());
  auto pong = Send(d, {{"jsonrpc", "2.0"}, {"id", 5}, {"method", "ping"}});
  EXPECT_TRUE(pong["result"].is_object());
  EXPECT_TRUE(pong["result"].empty());

  auto missing = Send(d, {{"jsonrpc", "2.0"}, {"id", 6}, {"method", "resources/list"}});
  EXPECT_EQ(missing["error"]["code"], rpc_error::kMethodNotFound);
  EXPECT_EQ(missing["error"]["data"]["method"], "resources/list");
  EXPECT_EQ(missing["id"], 6);
}

TEST_F(McpDispatcherTest, EnvelopeErrors) {
  DispatcherOptions opts = Options();
  opts.max_body_bytes = 256;
  McpDispatcher d(&registry, opts);

  auto parse = d.HandleBody("{not json");
  ASSERT_TRUE(parse.has_value());
  EXPECT_EQ((*parse)["error"]["code"], rpc_error::kParseError);
  EXPECT_TRUE((*parse)["id"].is_null());

  auto big = d.HandleBody(std::string(1000, ' '));
  ASSERT_TRUE(big.has_value());
  EXPECT_EQ((*big)["error"]["code"], rpc_error::kInvalidRequest);
}

TEST_F(McpDispatcherTest, NotificationsGetNoResponse) {
  McpDispatcher d(&registry, Options());
  EXPECT_FALSE(d.HandleBody(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
}

TEST_F(McpDispatcherTest, ValidationErrorNamesField) {
  McpDispatcher d(&registry, Options());
  auto resp = Send(d, Call("pcli2_geometric_match", {{"path", "/Root/a.stl"}, {"threshold", 150}}, 9));
  EXPECT_EQ(resp["id"], 9);
  EXPECT_EQ(resp["error"]["code"], rpc_error::kInvalidParams);
  EXPECT_EQ(resp["error"]["data"]["field"], "threshold");
  EXPECT_FALSE(resp.contains("result"));
}

TEST_F(McpDispatcherTest, UnknownToolCode) {
  McpDispatcher d(&registry, Options());
  auto resp = Send(d, Call("pcli2_delete_everything", nlohmann::json::object()));
  EXPECT_EQ(resp["error"]["code"], rpc_error::kToolNotFound);
  EXPECT_EQ(resp["error"]["data"]["tool"], "pcli2_delete_everything");
}

TEST_F(McpDispatcherTest, ExecutesValidatedArgvVerbatim) {
  const auto program = Mock("printf '%s' \"$*\"");
  auto tools = BuildPcli2ToolRegistry(program);
  McpDispatcher d(&tools, Options());

  const nlohmann::json args = {{"path", "/Root/Folder/Part.stl"}, {"threshold", 85}, {"format", "csv"}, {"headers", true}};
  auto resp = Send(d, Call("pcli2_geometric_match", args));
  ASSERT_TRUE(resp.contains("result")) << resp.dump();
  const auto& result = resp["result"];
  EXPECT_EQ(result["isError"], false);

  ValidationError err;
  auto validated = ValidateToolCall(tools, "pcli2_geometric_match", args, &err);
  ASSERT_TRUE(validated.has_value());
  const auto inv = BuildInvocation(*validated->tool, *validated);
  EXPECT_EQ(result["content"][0]["text"], ShellJoin(inv.Arguments()));
  EXPECT_EQ(result["content"][0]["text"],
            "asset geometric-match --path /Root/Folder/Part.stl --threshold 85.00 --format csv --headers");
  EXPECT_EQ(result["_meta"]["format"], "csv");
}

TEST_F(McpDispatcherTest, MetacharactersReachProgramAsOneArgument) {
  const auto marker = "/tmp/pcli2-mcp-injected-" + std::to_string(::getpid());
  std::remove(marker.c_str());
  const auto program = Mock("for a in \"$@\"; do printf '%s\\n' \"$a\"; done");
  auto tools = BuildPcli2ToolRegistry(program);
  McpDispatcher d(&tools, Options());

  const std::string hostile = "/Root/$(touch " + marker + "); touch " + marker + " `touch " + marker + "`";
  auto resp = Send(d, Call("pcli2_asset_get", {{"path", hostile}}));
  ASSERT_TRUE(resp.contains("result")) << resp.dump();
  EXPECT_EQ(resp["result"]["content"][0]["text"], "asset\nget\n--path\n" + hostile + "\n--format\njson\n");
  EXPECT_NE(::access(marker.c_str(), F_OK), 0);
}

TEST_F(McpDispatcherTest, NonZeroExitIsToolError) {
  const auto program = Mock("echo 'asset not found' >&2; exit 4");
  auto tools = BuildPcli2ToolRegistry(program);
  McpDispatcher d(&tools, Options());

  auto resp = Send(d, Call("pcli2_asset_get", {{"uuid", "missing"}}));
  ASSERT_TRUE(resp.contains("result"));
  EXPECT_EQ(resp["result"]["isError"], true);
  EXPECT_EQ(resp["result"]["_meta"]["errorCode"], rpc_error::kExecutionFailed);
  const auto text = resp["result"]["content"][0]["text"].get<std::string>();
  EXPECT_NE(text.find("exited with code 4"), std::string::npos);
  EXPECT_NE(text.find("asset not found"), std::string::npos);
}

TEST_F(McpDispatcherTest, TimeoutIsToolError) {
  const auto program = Mock("sleep 30");
  auto tools = BuildPcli2ToolRegistry(program);
  DispatcherOptions opts = Options();
  opts.limits.wall_clock = std::chrono::milliseconds(300);
  McpDispatcher d(&tools, opts);

  auto resp = Send(d, Call("pcli2_tenant_list", nlohmann::json::object()));
  EXPECT_EQ(resp["result"]["isError"], true);
  EXPECT_EQ(resp["result"]["_meta"]["errorKind"], "timeout");
}

TEST_F(McpDispatcherTest, MissingProgramIsToolError) {
  auto tools = BuildPcli2ToolRegistry("/nonexistent/bin/pcli2");
  McpDispatcher d(&tools, Options());

  auto resp = Send(d, Call("pcli2_tenant_list", nlohmann::json::object()));
  ASSERT_TRUE(resp.contains("result"));
  EXPECT_EQ(resp["result"]["isError"], true);
  EXPECT_EQ(resp["result"]["_meta"]["errorKind"], "spawn");
  EXPECT_NE(resp["result"]["content"][0]["text"].get<std::string>().find("/nonexistent/bin/pcli2"),
            std::string::npos);
}

TEST_F(McpDispatcherTest, InFlightLimitRejectsExtraCalls) {
  const auto program = Mock("sleep 1; printf ok");
  auto tools = BuildPcli2ToolRegistry(program);
  DispatcherOptions opts = Options();
  opts.max_in_flight = 1;
  McpDispatcher d(&tools, opts);

  nlohmann::json first;
  std::thread slow([&] { first = *d.HandleBody(Call("pcli2_tenant_list", nlohmann::json::object(), 1).dump()); });
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  auto second = Send(d, Call("pcli2_tenant_list", nlohmann::json::object(), 2));
  slow.join();

  EXPECT_EQ(second["result"]["isError"], true);
  EXPECT_EQ(second["result"]["_meta"]["errorKind"], "busy");
  EXPECT_EQ(first["result"]["isError"], false);
  EXPECT_EQ(first["result"]["content"][0]["text"], "ok");

  auto third = Send(d, Call("pcli2_tenant_list", nlohmann::json::object(), 3));
  EXPECT_EQ(third["result"]["isError"], false);
}

TEST_F(McpDispatcherTest, Latin1OutputStillAnswersWithTheRequestId) {
  const auto program = Mock("printf 'caf\\351\\n'");
  auto tools = BuildPcli2ToolRegistry(program);
  McpDispatcher d(&tools, Options());

  auto resp = Send(d, Call("pcli2_tenant_list", nlohmann::json::object(), 41));
  std::string wire;
  ASSERT_NO_THROW(wire = resp.dump());
  auto parsed = nlohmann::json::parse(wire);
  EXPECT_EQ(parsed["id"], 41);
  EXPECT_EQ(parsed["result"]["isError"], false);
  EXPECT_EQ(parsed["result"]["content"][0]["text"], "caf\xEF\xBF\xBD\n");
}

TEST_F(McpDispatcherTest, BinaryStderrOnFailureStillAnswers) {
  const auto program = Mock("printf '\\377\\376 bad' >&2; exit 3");
  auto tools = BuildPcli2ToolRegistry(program);
  McpDispatcher d(&tools, Options());

  auto resp = Send(d, Call("pcli2_tenant_list", nlohmann::json::object(), 42));
  std::string wire;
  ASSERT_NO_THROW(wire = resp.dump());
  auto parsed = nlohmann::json::parse(wire);
  EXPECT_EQ(parsed["id"], 42);
  EXPECT_EQ(parsed["result"]["isError"], true);
  const auto text = parsed["result"]["content"][0]["text"].get<std::string>();
  EXPECT_NE(text.find("exited with code 3"), std::string::npos);
  EXPECT_NE(text.find("\xEF\xBF\xBD\xEF\xBF\xBD bad"), std::string::npos);
}

TEST_F(McpDispatcherTest, OutputCapSplittingACharacterKeepsValidText) {
  const auto program = Mock("printf 'a\\303\\251\\303\\251'");
  auto tools = BuildPcli2ToolRegistry(program);
  DispatcherOptions opts = Options();
  opts.limits.max_output_bytes = 2;
  McpDispatcher d(&tools, opts);

  auto resp = Send(d, Call("pcli2_tenant_list", nlohmann::json::object(), 43));
  std::string wire;
  ASSERT_NO_THROW(wire = resp.dump());
  auto parsed = nlohmann::json::parse(wire);
  EXPECT_EQ(parsed["id"], 43);
  EXPECT_EQ(parsed["result"]["isError"], false);
  EXPECT_EQ(parsed["result"]["content"][0]["text"], "a");
  EXPECT_EQ(parsed["result"]["_meta"]["truncated"], true);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
