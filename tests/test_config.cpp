#include <gtest/gtest.h>
#include "config.hpp"

#include <stdlib.h>

#include <string>
#include <vector>

using namespace pcli2mcp;

class ConfigTest : public ::testing::Test {
protected:
  void TearDown() override {
    for (const char* name : {"PCLI2_MCP_LISTEN_HOST", "PCLI2_MCP_LISTEN_PORT", "PCLI2_MCP_PROGRAM",
                             "PCLI2_MCP_MAX_BODY_BYTES", "PCLI2_MCP_TIMEOUT_S", "PCLI2_MCP_MAX_OUTPUT_BYTES",
                             "PCLI2_MCP_MAX_IN_FLIGHT", "PCLI2_MCP_INLINE_IMAGES", "PCLI2_MCP_VERBOSE"}) {
      ::unsetenv(name);
    }
  }
};

TEST_F(ConfigTest, Defaults) {
  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.listen.host, "127.0.0.1");
  EXPECT_EQ(cfg.listen.port, 8080);
  EXPECT_EQ(cfg.program, "pcli2");
  EXPECT_EQ(cfg.max_body_bytes, 1024u * 1024u);
  EXPECT_EQ(cfg.timeout_seconds, 120);
  EXPECT_EQ(cfg.max_output_bytes, 8u * 1024u * 1024u);
  EXPECT_EQ(cfg.max_in_flight, 16);
  EXPECT_TRUE(cfg.inline_images);
  EXPECT_FALSE(cfg.verbose);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  ::setenv("PCLI2_MCP_LISTEN_HOST", "0.0.0.0", 1);
  ::setenv("PCLI2_MCP_LISTEN_PORT", "9191", 1);
  ::setenv("PCLI2_MCP_PROGRAM", "/opt/pcli2/bin/pcli2", 1);
  ::setenv("PCLI2_MCP_TIMEOUT_S", "30", 1);
  ::setenv("PCLI2_MCP_MAX_IN_FLIGHT", "0", 1);
  ::setenv("PCLI2_MCP_INLINE_IMAGES", "off", 1);
  ::setenv("PCLI2_MCP_VERBOSE", "yes", 1);

  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.listen.host, "0.0.0.0");
  EXPECT_EQ(cfg.listen.port, 9191);
  EXPECT_EQ(cfg.program, "/opt/pcli2/bin/pcli2");
  EXPECT_EQ(cfg.timeout_seconds, 30);
  EXPECT_EQ(cfg.max_in_flight, 0);
  EXPECT_FALSE(cfg.inline_images);
  EXPECT_TRUE(cfg.verbose);
}

TEST_F(ConfigTest, UnparseableValuesKeepDefaults) {
  ::setenv("PCLI2_MCP_LISTEN_PORT", "http", 1);
  ::setenv("PCLI2_MCP_TIMEOUT_S", "-5", 1);
  ::setenv("PCLI2_MCP_MAX_OUTPUT_BYTES", "12abc", 1);
  ::setenv("PCLI2_MCP_INLINE_IMAGES", "maybe", 1);

  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.listen.port, 8080);
  EXPECT_EQ(cfg.timeout_seconds, 120);
  EXPECT_EQ(cfg.max_output_bytes, 8u * 1024u * 1024u);
  EXPECT_TRUE(cfg.inline_images);
}

TEST_F(ConfigTest, CommandLineOverridesEnvironment) {
  ::setenv("PCLI2_MCP_LISTEN_PORT", "9191", 1);
  auto cfg = LoadConfigFromEnv();
  CommandLineOptions opts;
  std::string err;
  ASSERT_TRUE(ApplyCommandLine({"--port", "7000", "--program", "./pcli2", "--timeout", "5", "--verbose"}, &cfg, &opts,
                               &err))
      << err;
  EXPECT_EQ(cfg.listen.port, 7000);
  EXPECT_EQ(cfg.program, "./pcli2");
  EXPECT_EQ(cfg.timeout_seconds, 5);
  EXPECT_TRUE(cfg.verbose);
  EXPECT_FALSE(opts.print_config);
}

TEST_F(ConfigTest, CommandLineErrors) {
  GatewayConfig cfg;
  CommandLineOptions opts;
  std::string err;
  EXPECT_FALSE(ApplyCommandLine({"--port"}, &cfg, &opts, &err));
  EXPECT_NE(err.find("--port"), std::string::npos);

  EXPECT_FALSE(ApplyCommandLine({"--port", "70000"}, &cfg, &opts, &err));
  EXPECT_NE(err.find("invalid port"), std::string::npos);

  EXPECT_FALSE(ApplyCommandLine({"--frobnicate"}, &cfg, &opts, &err));
  EXPECT_NE(err.find("--frobnicate"), std::string::npos);
}

TEST_F(ConfigTest, InformationalFlags) {
  GatewayConfig cfg;
  CommandLineOptions opts;
  std::string err;
  ASSERT_TRUE(ApplyCommandLine({"--print-config", "--help"}, &cfg, &opts, &err));
  EXPECT_TRUE(opts.print_config);
  EXPECT_TRUE(opts.help);
  EXPECT_NE(Usage("pcli2-mcp").find("PCLI2_MCP_PROGRAM"), std::string::npos);
}

TEST_F(ConfigTest, HttpWorkersExceedTheInFlightCap) {
  GatewayConfig cfg;
  EXPECT_EQ(HttpWorkerThreads(cfg), 24u);

  cfg.max_in_flight = 1;
  EXPECT_EQ(HttpWorkerThreads(cfg), 9u);

  cfg.max_in_flight = 100;
  EXPECT_GT(HttpWorkerThreads(cfg), 100u);

  cfg.max_in_flight = 0;
  EXPECT_EQ(HttpWorkerThreads(cfg), 64u);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
