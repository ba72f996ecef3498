#include "tempest/app.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace tempest;

namespace {

const char *kStrike =
    R"({"serial_number":"AR-00004049","type":"evt_strike","hub_sn":"HB-00000001","evt":[1493322445,27,3848]})";

} // namespace

TEST(App, StructModeLogsRecords) {
    App app;
    EXPECT_TRUE(app.handle(kStrike, "127.0.0.1:50222"));

    ASSERT_EQ(app.log().size(), 1u);
    EXPECT_EQ(app.log().entries().back().type, app::ConsoleEntryType::Event);
    EXPECT_EQ(app.log().entries().back().origin, "127.0.0.1:50222");
    EXPECT_EQ(app.stats().handled, 1u);
    EXPECT_EQ(app.stats().failed, 0u);
}

TEST(App, StructModeKeepsEveryDecodedField) {
    App app;
    EXPECT_TRUE(app.handle(R"({"serial_number":"HB-00000001","type":"hub_status",
                              "firmware_revision":"35","uptime":1670133,"rssi":-62,
                              "timestamp":1495724691,"reset_flags":"BOR,PIN,POR","seq":48,
                              "fs":[1,0,15675411,524288],"radio_stats":[2,1,0,3,2839],
                              "mqtt_stats":[1,0]})",
                           "test"));

    ASSERT_EQ(app.log().size(), 1u);
    auto full = nlohmann::json::parse(app.log().entries().back().detail);
    EXPECT_EQ(full["reset_flags"], "BOR,PIN,POR");
    EXPECT_EQ(full["fs"], nlohmann::json::parse("[1,0,15675411,524288]"));
    EXPECT_EQ(full["radio_stats"], nlohmann::json::parse("[2,1,0,3,2839]"));
    EXPECT_EQ(full["mqtt_stats"], nlohmann::json::parse("[1,0]"));
}

TEST(App, StructModeCountsFailures) {
    App app;
    EXPECT_FALSE(app.handle(R"({"type":"rapid_wind","serial_number":"S","hub_sn":"H","ob":[1]})",
                            "test"));
    EXPECT_FALSE(app.handle("not json", "test"));

    EXPECT_EQ(app.stats().handled, 2u);
    EXPECT_EQ(app.stats().failed, 2u);
    ASSERT_EQ(app.log().size(), 2u);
    EXPECT_EQ(app.log().entries().front().type, app::ConsoleEntryType::Error);
    EXPECT_EQ(app.log().entries().front().detail,
              R"({"type":"rapid_wind","serial_number":"S","hub_sn":"H","ob":[1]})");
}

TEST(App, ParsedModeOnlyChecksJson) {
    App app;
    app::Options opts;
    opts.mode = app::DisplayMode::Parsed;
    app.set_options(opts);

    // Not a valid rapid_wind, but valid JSON.
    EXPECT_TRUE(app.handle(R"({"type":"rapid_wind","ob":[1]})", "test"));
    EXPECT_FALSE(app.handle("{", "test"));
    EXPECT_EQ(app.stats().failed, 1u);
    EXPECT_EQ(app.log().size(), 1u);
}

TEST(App, RawModeNeverFails) {
    App app;
    app::Options opts;
    opts.mode = app::DisplayMode::Raw;
    app.set_options(opts);

    EXPECT_TRUE(app.handle("garbage", "test"));
    EXPECT_EQ(app.stats().handled, 1u);
    EXPECT_TRUE(app.log().empty());
}

TEST(App, HelpExitsCleanly) {
    App app;
    char program[] = "tempest-listen";
    char flag[] = "--help";
    char *argv[] = {program, flag};
    EXPECT_EQ(app.run(2, argv), 0);
}

TEST(App, UsageErrorExitCode) {
    App app;
    char program[] = "tempest-listen";
    char flag[] = "--mode";
    char value[] = "pretty";
    char *argv[] = {program, flag, value};
    EXPECT_EQ(app.run(3, argv), 2);
}
