#include "tempest/app/options.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace tempest::app;

TEST(Options, Defaults) {
    auto opts = parse_options({});
    EXPECT_FALSE(opts.count.has_value());
    EXPECT_EQ(opts.bufsize, 400u);
    EXPECT_EQ(opts.addr, "0.0.0.0:50222");
    EXPECT_EQ(opts.mode, DisplayMode::Struct);
    EXPECT_FALSE(opts.token.has_value());
    EXPECT_FALSE(opts.device_id.has_value());
    EXPECT_FALSE(opts.rapid_wind);
    EXPECT_EQ(opts.cloud_url, "wss://ws.weatherflow.com/swd/data");
    EXPECT_EQ(opts.cloud_url, tempest::protocol::CloudClient::kDefaultUrl);
    EXPECT_FALSE(opts.help);
}

TEST(Options, ShortAndLongFlags) {
    auto opts = parse_options({"-c", "5", "--bufsize", "1024", "-a", "127.0.0.1:6000", "-m", "raw"});
    EXPECT_EQ(opts.count, 5u);
    EXPECT_EQ(opts.bufsize, 1024u);
    EXPECT_EQ(opts.addr, "127.0.0.1:6000");
    EXPECT_EQ(opts.mode, DisplayMode::Raw);
}

TEST(Options, InlineValues) {
    auto opts = parse_options({"--count=2", "--mode=parsed", "--addr=10.0.0.2:50222"});
    EXPECT_EQ(opts.count, 2u);
    EXPECT_EQ(opts.mode, DisplayMode::Parsed);
    EXPECT_EQ(opts.addr, "10.0.0.2:50222");
}

TEST(Options, CloudSource) {
    auto opts = parse_options(
        {"--token", "secret", "--device-id", "1110", "--rapid-wind", "--cloud-url", "ws://x/y"});
    EXPECT_EQ(opts.token, "secret");
    EXPECT_EQ(opts.device_id, 1110u);
    EXPECT_TRUE(opts.rapid_wind);
    EXPECT_EQ(opts.cloud_url, "ws://x/y");
}

TEST(Options, Help) {
    EXPECT_TRUE(parse_options({"-h"}).help);
    EXPECT_TRUE(parse_options({"--help"}).help);
    EXPECT_NE(usage("tempest-listen").find("--bufsize"), std::string::npos);
}

TEST(Options, Rejections) {
    EXPECT_THROW(parse_options({"--bogus"}), std::invalid_argument);
    EXPECT_THROW(parse_options({"--count"}), std::invalid_argument);
    EXPECT_THROW(parse_options({"--count", "ten"}), std::invalid_argument);
    EXPECT_THROW(parse_options({"--count", "-1"}), std::invalid_argument);
    EXPECT_THROW(parse_options({"--bufsize", "0"}), std::invalid_argument);
    EXPECT_THROW(parse_options({"--mode", "pretty"}), std::invalid_argument);
    EXPECT_THROW(parse_options({"--addr", "localhost"}), std::invalid_argument);
    EXPECT_THROW(parse_options({"--device-id", "abc"}), std::invalid_argument);
}

TEST(Options, SplitAddress) {
    auto [host, port] = split_address("0.0.0.0:50222");
    EXPECT_EQ(host, "0.0.0.0");
    EXPECT_EQ(port, 50222);

    EXPECT_THROW(split_address(":50222"), std::invalid_argument);
    EXPECT_THROW(split_address("0.0.0.0:"), std::invalid_argument);
    EXPECT_THROW(split_address("0.0.0.0:70000"), std::invalid_argument);
}

TEST(Options, ModeNames) {
    for (auto mode : {DisplayMode::Struct, DisplayMode::Parsed, DisplayMode::Raw}) {
        EXPECT_EQ(parse_mode(to_string(mode)), mode);
    }
}
