#include "tempest/app/console.hpp"
#include "tempest/protocol/decoder.hpp"

#include <gtest/gtest.h>

using namespace tempest::app;
using tempest::protocol::DecodeError;
using tempest::protocol::Record;

namespace {

Record decode_record(const std::string &text) {
    auto result = tempest::protocol::decode_envelope(text);
    EXPECT_TRUE(std::holds_alternative<Record>(result)) << text;
    return std::get<Record>(std::move(result));
}

std::string summary(const std::string &text) {
    return ConsoleLog::format_record(decode_record(text));
}

} // namespace

TEST(ConsoleLog, AddEntryIncreasesSize) {
    ConsoleLog log(8, false);
    EXPECT_TRUE(log.empty());

    log.add(ConsoleEntryType::System, "Connected");

    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries().back().type, ConsoleEntryType::System);
    EXPECT_EQ(log.entries().back().message, "Connected");
    EXPECT_GE(log.entries().back().wall_time, 0.0);
}

TEST(ConsoleLog, CapacityIsEnforcedWithRollingBuffer) {
    ConsoleLog log(3, false);
    log.add(ConsoleEntryType::System, "one");
    log.add(ConsoleEntryType::System, "two");
    log.add(ConsoleEntryType::System, "three");
    log.add(ConsoleEntryType::System, "four");

    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log.entries().front().message, "two");
    EXPECT_EQ(log.entries().back().message, "four");

    log.clear();
    EXPECT_TRUE(log.empty());
}

TEST(ConsoleLog, AddRecordKeepsOrigin) {
    ConsoleLog log(8, false);
    log.add_record(decode_record(
                       R"({"serial_number":"SK-00008453","type":"evt_precip","hub_sn":"HB-00000001","evt":[1493322445]})"),
                   "192.168.1.20:50222");

    ASSERT_EQ(log.size(), 1u);
    const auto &entry = log.entries().back();
    EXPECT_EQ(entry.type, ConsoleEntryType::Event);
    EXPECT_EQ(entry.message, "SK-00008453 rain start at 1493322445");
    EXPECT_EQ(entry.origin, "192.168.1.20:50222");
}

TEST(ConsoleLog, AddErrorKeepsRawText) {
    ConsoleLog log(8, false);
    log.add_error(DecodeError::missing_discriminator(), "{}", "cloud");

    ASSERT_EQ(log.size(), 1u);
    const auto &entry = log.entries().back();
    EXPECT_EQ(entry.type, ConsoleEntryType::Error);
    EXPECT_EQ(entry.message, "missing_discriminator: envelope has no 'type'");
    EXPECT_EQ(entry.detail, "{}");
    EXPECT_EQ(entry.origin, "cloud");
}

TEST(ConsoleLog, FormatEvents) {
    EXPECT_EQ(
        summary(
            R"({"serial_number":"AR-00004049","type":"evt_strike","hub_sn":"HB-00000001","evt":[1493322445,27,3848]})"),
        "AR-00004049 lightning strike at 1493322445: 27 km, energy 3848");
    EXPECT_EQ(
        summary(
            R"({"serial_number":"SK-00008453","type":"rapid_wind","hub_sn":"HB-00000001","ob":[1493322445,2.3,128]})"),
        "SK-00008453 wind 2.3 m/s from 128 deg");
}

TEST(ConsoleLog, FormatObservations) {
    EXPECT_EQ(summary(R"({"serial_number":"AR-00004049","type":"obs_air","hub_sn":"HB-00000001",
                          "obs":[[1493164835,835.0,10.0,45,0,0,3.46,1]]})"),
              "AR-00004049 air: 10 C, 45 %, 835 mb (1 obs)");
    EXPECT_EQ(summary(R"({"serial_number":"SK-00008453","type":"obs_sky","hub_sn":"HB-00000001",
                          "obs":[[1493321340,9000,10,0.0,2.6,4.6,7.4,187,3.12,1,130,null,0,3]]})"),
              "SK-00008453 sky: 9000 lux, uv 10, wind 4.6 m/s gust 7.4 (1 obs)");
    EXPECT_EQ(
        summary(R"({"serial_number":"AR-00000512","type":"obs_st","hub_sn":"HB-00013030",
                    "obs":[[1588948614,0.18,0.22,0.27,144,6,1017.57,22.37,50.26,328,0.03,3,
                            0.00000,0,0,0,2.410,1]]})"),
        "AR-00000512 tempest: 22.37 C, 50.26 %, 1017.57 mb, wind 0.22 m/s from 144 deg (1 obs)");
    EXPECT_EQ(summary(R"({"serial_number":"AR-1","type":"obs_air","hub_sn":"HB-1","obs":[]})"),
              "AR-1 air: no samples");
}

TEST(ConsoleLog, FormatStatus) {
    EXPECT_EQ(summary(R"({"serial_number":"AR-00004049","type":"device_status",
                          "hub_sn":"HB-00000001","timestamp":1510855923,"uptime":2189,
                          "voltage":3.50,"firmware_revision":17,"rssi":-17,"hub_rssi":-87,
                          "sensor_status":0,"debug":0})"),
              "AR-00004049 device status: 3.5 V, rssi -17, uptime 2189 s, sensor_status 0x0");
    EXPECT_EQ(summary(R"({"serial_number":"HB-00000001","type":"hub_status",
                          "firmware_revision":"35","uptime":1670133,"rssi":-62,
                          "timestamp":1495724691,"reset_flags":"BOR,PIN,POR","seq":48,
                          "radio_stats":[2,1,0,3,2839]})"),
              "HB-00000001 hub status: fw 35, rssi -62, uptime 1670133 s, seq 48");
}

TEST(ConsoleLog, FormatUnknownMessages) {
    EXPECT_EQ(summary(R"({"type":"connection","event":"connected"})"), "Connected");
    EXPECT_EQ(summary(R"({"type":"connection","event":"disconnected"})"), "Disconnected");
    EXPECT_EQ(summary(R"({"type":"connection","event":"error","message":"timeout"})"),
              "Connection error: timeout");
    EXPECT_EQ(summary(R"({"type":"connection_opened"})"), "Cloud session opened");
    EXPECT_EQ(summary(R"({"type":"ack","id":"tempest-1"})"), "ack tempest-1");
    EXPECT_EQ(summary(R"({"type":"ack","id":5})"), "ack");
    EXPECT_EQ(summary(R"({"type":"light_debug","serial_number":"ST-1"})"),
              "unhandled 'light_debug' from ST-1");
    EXPECT_EQ(summary(R"({"type":"light_debug"})"), "unhandled 'light_debug'");
}

TEST(ConsoleLog, EntryTypes) {
    EXPECT_EQ(ConsoleLog::entry_type(decode_record(
                  R"({"type":"obs_air","serial_number":"A","hub_sn":"H","obs":[]})")),
              ConsoleEntryType::Observation);
    EXPECT_EQ(ConsoleLog::entry_type(decode_record(
                  R"({"type":"connection","event":"error"})")),
              ConsoleEntryType::Error);
    EXPECT_EQ(ConsoleLog::entry_type(decode_record(R"({"type":"ack"})")),
              ConsoleEntryType::System);
    EXPECT_STREQ(ConsoleLog::entry_prefix(ConsoleEntryType::Status), "STS");
    EXPECT_STREQ(ConsoleLog::entry_prefix(ConsoleEntryType::Error), "ERR");
}
