#include "tempest/protocol/cloud_client.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace tempest::protocol;

TEST(CloudClient, FormatListenStart) {
    auto cmd = CloudClient::format_command("listen_start", 1110, "tempest-1");

    EXPECT_EQ(cmd["type"], "listen_start");
    EXPECT_EQ(cmd["device_id"], 1110);
    EXPECT_EQ(cmd["id"], "tempest-1");
    EXPECT_EQ(cmd.size(), 3u);
}

TEST(CloudClient, FormatRapidWind) {
    auto cmd = CloudClient::format_command("listen_rapid_start", 42, "tempest-7");
    EXPECT_EQ(cmd["type"], "listen_rapid_start");
    EXPECT_TRUE(cmd["device_id"].is_number_unsigned());
    EXPECT_EQ(cmd.dump(), R"({"device_id":42,"id":"tempest-7","type":"listen_rapid_start"})");
}

TEST(CloudClient, UrlCarriesToken) {
    EXPECT_EQ(CloudClient::make_url(CloudClient::kDefaultUrl, "abc"),
              "wss://ws.weatherflow.com/swd/data?token=abc");
    EXPECT_EQ(CloudClient::make_url("ws://localhost:9000/data?api=1", "abc"),
              "ws://localhost:9000/data?api=1&token=abc");
}

TEST(CloudClient, StartsDisconnected) {
    CloudClient client("abc", "ws://127.0.0.1:1/data");
    EXPECT_EQ(client.state(), ConnectionState::Disconnected);
    EXPECT_TRUE(client.queue().empty());
}

TEST(CloudClient, StopWhileDisconnectedOnlyForgets) {
    CloudClient client("abc", "ws://127.0.0.1:1/data");
    client.listen(1110);
    client.listen_rapid_wind(1110);
    client.listen(2220);
    EXPECT_EQ(client.subscription_count(), 3u);

    client.stop(1110);
    EXPECT_EQ(client.subscription_count(), 1u);
    client.stop(3330);
    EXPECT_EQ(client.subscription_count(), 1u);
    EXPECT_EQ(client.state(), ConnectionState::Disconnected);
}

TEST(CloudClient, RepeatedListenIsRememberedOnce) {
    CloudClient client("abc", "ws://127.0.0.1:1/data");
    client.listen(1110);
    client.listen(1110);
    client.listen_rapid_wind(1110);
    client.listen_rapid_wind(1110);
    EXPECT_EQ(client.subscription_count(), 2u);
}

TEST(CloudClient, ConcurrentListenIsRememberedOnce) {
    CloudClient client("abc", "ws://127.0.0.1:1/data");
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&client] {
            for (int n = 0; n < 100; ++n) {
                client.listen(1110);
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    EXPECT_EQ(client.subscription_count(), 1u);
}
