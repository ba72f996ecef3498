#include "tempest/app/console.hpp"
#include "tempest/protocol/serialize.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdio>

namespace tempest::app {

namespace {

using namespace tempest::protocol;

// Unknown messages come straight off the wire: tolerate any field shape.
std::string text_field(const nlohmann::json &msg, const char *key) {
    auto it = msg.find(key);
    if (it == msg.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string format_connection(const nlohmann::json &msg) {
    const std::string event = text_field(msg, "event");
    if (event == "connected") {
        return "Connected";
    }
    if (event == "disconnected") {
        return "Disconnected";
    }
    if (event == "error") {
        const std::string message = text_field(msg, "message");
        if (message.empty()) {
            return "Connection error";
        }
        return "Connection error: " + message;
    }
    if (!event.empty()) {
        return "Connection " + event;
    }
    return "Connection event";
}

std::string samples(size_t n) { return n == 1 ? "(1 obs)" : "(" + std::to_string(n) + " obs)"; }

std::string format_precip(const EvtPrecip &m) {
    return m.serial_number + " rain start at " + std::to_string(m.evt.epoch);
}

std::string format_strike(const EvtStrike &m) {
    return m.serial_number + " lightning strike at " + std::to_string(m.evt.epoch) + ": " +
           std::to_string(m.evt.distance) + " km, energy " + std::to_string(m.evt.energy);
}

std::string format_rapid_wind(const RapidWind &m) {
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), " wind %.6g m/s from %" PRIu32 " deg",
                  m.ob.wind_speed, m.ob.wind_direction);
    return m.serial_number + buffer;
}

std::string format_air(const ObsAir &m) {
    if (m.obs.empty()) {
        return m.serial_number + " air: no samples";
    }
    const auto &ob = m.obs.back();
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), " air: %.6g C, %.6g %%, %.6g mb ", ob.air_temperature,
                  ob.relative_humidity, ob.station_pressure);
    return m.serial_number + buffer + samples(m.obs.size());
}

std::string format_sky(const ObsSky &m) {
    if (m.obs.empty()) {
        return m.serial_number + " sky: no samples";
    }
    const auto &ob = m.obs.back();
    char buffer[160];
    std::snprintf(buffer, sizeof(buffer),
                  " sky: %" PRIu32 " lux, uv %.6g, wind %.6g m/s gust %.6g ", ob.illuminance,
                  ob.uv, ob.wind_avg, ob.wind_gust);
    return m.serial_number + buffer + samples(m.obs.size());
}

std::string format_st(const ObsSt &m) {
    if (m.obs.empty()) {
        return m.serial_number + " tempest: no samples";
    }
    const auto &ob = m.obs.back();
    char buffer[192];
    std::snprintf(buffer, sizeof(buffer),
                  " tempest: %.6g C, %.6g %%, %.6g mb, wind %.6g m/s from %" PRIu32 " deg ",
                  ob.air_temperature, ob.relative_humidity, ob.station_pressure, ob.wind_avg,
                  ob.wind_direction);
    return m.serial_number + buffer + samples(m.obs.size());
}

std::string format_device_status(const DeviceStatus &m) {
    char buffer[160];
    std::snprintf(buffer, sizeof(buffer),
                  " device status: %.6g V, rssi %" PRId32 ", uptime %" PRIu32
                  " s, sensor_status 0x%" PRIx32,
                  m.voltage, m.rssi, m.uptime, m.sensor_status);
    return m.serial_number + buffer;
}

std::string format_hub_status(const HubStatus &m) {
    char buffer[160];
    std::snprintf(buffer, sizeof(buffer), ", rssi %" PRId32 ", uptime %" PRIu32 " s, seq %" PRIu32,
                  m.rssi, m.uptime, m.seq);
    return m.serial_number + " hub status: fw " + m.firmware_revision + buffer;
}

} // namespace

ConsoleLog::ConsoleLog(size_t max_entries, bool echo)
    : max_entries_(std::max<size_t>(max_entries, 1)), echo_(echo),
      start_time_(std::chrono::steady_clock::now()) {}

void ConsoleLog::add(ConsoleEntryType type, const std::string &message, const std::string &detail,
                     const std::string &origin) {
    if (entries_.size() >= max_entries_) {
        entries_.pop_front();
    }

    entries_.push_back(ConsoleEntry{
        .type = type,
        .message = message,
        .detail = detail,
        .origin = origin,
        .wall_time = elapsed(),
    });

    if (!echo_) {
        return;
    }
    // Mirror to terminal; errors go to stderr.
    std::FILE *out = type == ConsoleEntryType::Error ? stderr : stdout;
    if (origin.empty()) {
        std::fprintf(out, "[%s] %s\n", entry_prefix(type), message.c_str());
    } else {
        std::fprintf(out, "[%s] %s (%s)\n", entry_prefix(type), message.c_str(), origin.c_str());
    }
}

void ConsoleLog::add_record(const protocol::Record &record, const std::string &origin) {
    add(entry_type(record), format_record(record), protocol::to_json(record).dump(), origin);
}

void ConsoleLog::add_error(const protocol::DecodeError &error, const std::string &raw,
                           const std::string &origin) {
    add(ConsoleEntryType::Error, protocol::to_string(error), raw, origin);
}

const std::deque<ConsoleEntry> &ConsoleLog::entries() const { return entries_; }

size_t ConsoleLog::size() const { return entries_.size(); }

bool ConsoleLog::empty() const { return entries_.empty(); }

void ConsoleLog::clear() { entries_.clear(); }

double ConsoleLog::elapsed() const {
    const auto now = std::chrono::steady_clock::now();
    const auto delta = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_time_);
    return delta.count();
}

std::string ConsoleLog::format_record(const protocol::Record &record) {
    switch (record.kind()) {
    case RecordKind::EvtPrecip:
        return format_precip(*record.get_if<EvtPrecip>());
    case RecordKind::EvtStrike:
        return format_strike(*record.get_if<EvtStrike>());
    case RecordKind::RapidWind:
        return format_rapid_wind(*record.get_if<RapidWind>());
    case RecordKind::ObsAir:
        return format_air(*record.get_if<ObsAir>());
    case RecordKind::ObsSky:
        return format_sky(*record.get_if<ObsSky>());
    case RecordKind::ObsSt:
        return format_st(*record.get_if<ObsSt>());
    case RecordKind::DeviceStatus:
        return format_device_status(*record.get_if<DeviceStatus>());
    case RecordKind::HubStatus:
        return format_hub_status(*record.get_if<HubStatus>());
    case RecordKind::Unknown:
        return format_unknown(*record.get_if<UnknownMessage>());
    }
    return std::string(record.type());
}

ConsoleEntryType ConsoleLog::entry_type(const protocol::Record &record) {
    switch (record.kind()) {
    case RecordKind::EvtPrecip:
    case RecordKind::EvtStrike:
        return ConsoleEntryType::Event;
    case RecordKind::RapidWind:
    case RecordKind::ObsAir:
    case RecordKind::ObsSky:
    case RecordKind::ObsSt:
        return ConsoleEntryType::Observation;
    case RecordKind::DeviceStatus:
    case RecordKind::HubStatus:
        return ConsoleEntryType::Status;
    case RecordKind::Unknown: {
        const auto *msg = record.get_if<UnknownMessage>();
        if (msg->type == "connection" && text_field(msg->payload, "event") == "error") {
            return ConsoleEntryType::Error;
        }
        return ConsoleEntryType::System;
    }
    }
    return ConsoleEntryType::System;
}

const char *ConsoleLog::entry_prefix(ConsoleEntryType type) {
    switch (type) {
    case ConsoleEntryType::Observation:
        return "OBS";
    case ConsoleEntryType::Event:
        return "EVT";
    case ConsoleEntryType::Status:
        return "STS";
    case ConsoleEntryType::Error:
        return "ERR";
    case ConsoleEntryType::System:
        return "SYS";
    }
    return "SYS";
}

std::string ConsoleLog::format_unknown(const protocol::UnknownMessage &msg) {
    if (msg.type == "connection") {
        return format_connection(msg.payload);
    }
    if (msg.type == "connection_opened") {
        return "Cloud session opened";
    }
    if (msg.type == "ack") {
        const std::string id = text_field(msg.payload, "id");
        return id.empty() ? "ack" : "ack " + id;
    }
    std::string out = "unhandled '" + msg.type + "'";
    if (msg.serial_number) {
        out += " from " + *msg.serial_number;
    }
    return out;
}

} // namespace tempest::app
