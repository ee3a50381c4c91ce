#include <gtest/gtest.h>
#include "config.h"
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

ProxyConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "gemini-keepalive-proxy");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return parseArgs((int)args.size(), argv.data());
}

}  // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { unsetenv("KEEPALIVE"); }
    void TearDown() override { unsetenv("KEEPALIVE"); }
};

TEST_F(ConfigTest, Defaults) {
    ProxyConfig cfg = parse({});
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.bind_address, "0.0.0.0");
    EXPECT_EQ(cfg.upstream_host, "generativelanguage.googleapis.com");
    EXPECT_EQ(cfg.upstream_scheme, "https");
    EXPECT_EQ(cfg.upstream_timeout_sec, 0);
    EXPECT_TRUE(cfg.keepalive_enabled);
    EXPECT_EQ(cfg.heartbeat_interval.count(), 2000);
    EXPECT_EQ(cfg.threads, 32);
    EXPECT_FALSE(cfg.use_ssl());
    EXPECT_FALSE(cfg.verbose);
    EXPECT_FALSE(cfg.show_help);
}

TEST_F(ConfigTest, ShortAndLongOptions) {
    ProxyConfig cfg = parse({"-p", "9000", "-b", "127.0.0.1", "-k", "false", "-i", "500",
                             "-u", "localhost:1234", "--upstream-scheme", "HTTP", "-t", "30",
                             "--threads", "4", "-v"});
    EXPECT_EQ(cfg.port, 9000);
    EXPECT_EQ(cfg.bind_address, "127.0.0.1");
    EXPECT_FALSE(cfg.keepalive_enabled);
    EXPECT_EQ(cfg.heartbeat_interval.count(), 500);
    EXPECT_EQ(cfg.upstream_host, "localhost:1234");
    EXPECT_EQ(cfg.upstream_scheme, "http");
    EXPECT_EQ(cfg.upstream_timeout_sec, 30);
    EXPECT_EQ(cfg.threads, 4);
    EXPECT_TRUE(cfg.verbose);

    cfg = parse({"--port", "1", "--heartbeat-interval", "1", "--keepalive", "on"});
    EXPECT_EQ(cfg.port, 1);
    EXPECT_EQ(cfg.heartbeat_interval.count(), 1);
    EXPECT_TRUE(cfg.keepalive_enabled);
}

TEST_F(ConfigTest, HelpFlag) {
    EXPECT_TRUE(parse({"-h"}).show_help);
    EXPECT_TRUE(parse({"--help"}).show_help);
}

TEST_F(ConfigTest, SslPair) {
    ProxyConfig cfg = parse({"--ssl-cert", "cert.pem", "--ssl-key", "key.pem"});
    EXPECT_TRUE(cfg.use_ssl());
    EXPECT_THROW(parse({"--ssl-cert", "cert.pem"}), std::invalid_argument);
    EXPECT_THROW(parse({"--ssl-key", "key.pem"}), std::invalid_argument);
}

TEST_F(ConfigTest, KeepaliveEnvironment) {
    setenv("KEEPALIVE", "false", 1);
    EXPECT_FALSE(parse({}).keepalive_enabled);

    // 只有字面量 "false" 关闭
    setenv("KEEPALIVE", "FALSE", 1);
    EXPECT_TRUE(parse({}).keepalive_enabled);
    setenv("KEEPALIVE", "0", 1);
    EXPECT_TRUE(parse({}).keepalive_enabled);
    setenv("KEEPALIVE", "", 1);
    EXPECT_TRUE(parse({}).keepalive_enabled);
    setenv("KEEPALIVE", "true", 1);
    EXPECT_TRUE(parse({}).keepalive_enabled);
}

TEST_F(ConfigTest, CommandLineOverridesEnvironment) {
    setenv("KEEPALIVE", "false", 1);
    EXPECT_TRUE(parse({"--keepalive", "true"}).keepalive_enabled);
}

TEST_F(ConfigTest, ParseBool) {
    EXPECT_TRUE(parseBool("true"));
    EXPECT_TRUE(parseBool("YES"));
    EXPECT_TRUE(parseBool("1"));
    EXPECT_FALSE(parseBool("False"));
    EXPECT_FALSE(parseBool("off"));
    EXPECT_FALSE(parseBool("0"));
    EXPECT_THROW(parseBool("maybe"), std::invalid_argument);
}

TEST_F(ConfigTest, InvalidValuesRejected) {
    EXPECT_THROW(parse({"-p", "abc"}), std::invalid_argument);
    EXPECT_THROW(parse({"-p", "80x"}), std::invalid_argument);
    EXPECT_THROW(parse({"-p", "70000"}), std::invalid_argument);
    EXPECT_THROW(parse({"-i", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"-i", "-5"}), std::invalid_argument);
    EXPECT_THROW(parse({"-t", "-1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--threads", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"-k", "sometimes"}), std::invalid_argument);
    EXPECT_THROW(parse({"--upstream-scheme", "ftp"}), std::invalid_argument);
    EXPECT_THROW(parse({"-u", ""}), std::invalid_argument);
}

TEST_F(ConfigTest, UnknownOptionAndMissingValue) {
    EXPECT_THROW(parse({"--nope"}), std::invalid_argument);
    EXPECT_THROW(parse({"-p"}), std::invalid_argument);
    EXPECT_THROW(parse({"--upstream-host"}), std::invalid_argument);
}
