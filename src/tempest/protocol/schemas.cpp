#include "tempest/protocol/schemas.hpp"

#include <optional>
#include <span>
#include <string>
#include <utility>

namespace tempest::protocol {

namespace {

using nlohmann::json;
using MaybeError = std::optional<DecodeError>;

MaybeError read_string(const json &obj, const char *key, std::string &out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return DecodeError::missing_field(key);
    }
    if (!it->is_string()) {
        return DecodeError::type_mismatch(key, "string", describe(*it));
    }
    out = it->get<std::string>();
    return std::nullopt;
}

template <typename T>
MaybeError read_scalar(const json &obj, const char *key, SlotType type, T &out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return DecodeError::missing_field(key);
    }
    if (it->is_null()) {
        return DecodeError::type_mismatch(key, to_string(type), "null");
    }
    auto coerced = coerce_field(*it, type, key);
    if (auto *err = std::get_if<DecodeError>(&coerced)) {
        return std::move(*err);
    }
    out = value_as<T>(std::get<SlotValue>(coerced));
    return std::nullopt;
}

// Absent and null both read as unset.
template <typename T>
MaybeError read_optional_scalar(const json &obj, const char *key, SlotType type,
                                std::optional<T> &out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        out.reset();
        return std::nullopt;
    }
    T value{};
    if (auto err = read_scalar(obj, key, type, value)) {
        return err;
    }
    out = value;
    return std::nullopt;
}

MaybeError find_array(const json &obj, const char *key, const json *&out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return DecodeError::missing_field(key);
    }
    if (!it->is_array()) {
        return DecodeError::type_mismatch(key, "array", describe(*it));
    }
    out = &*it;
    return std::nullopt;
}

// Positional payload held directly under `key`, e.g. "evt":[...].
MaybeError extract_payload(const json &obj, const char *key, std::span<const PositionalSlot> slots,
                           std::optional<Fields> &out) {
    const json *raw = nullptr;
    if (auto err = find_array(obj, key, raw)) {
        return err;
    }
    auto fields = extract(*raw, slots);
    if (auto *err = std::get_if<DecodeError>(&fields)) {
        return std::move(err->within(key));
    }
    out.emplace(std::move(std::get<Fields>(fields)));
    return std::nullopt;
}

// "obs":[[...], [...]]: one positional row per sample.
template <typename Row, typename Build>
MaybeError extract_rows(const json &obj, std::span<const PositionalSlot> slots, Build build,
                        std::vector<Row> &out) {
    const json *rows = nullptr;
    if (auto err = find_array(obj, "obs", rows)) {
        return err;
    }
    out.reserve(rows->size());
    for (size_t i = 0; i < rows->size(); ++i) {
        const auto &row = (*rows)[i];
        const std::string where = "obs[" + std::to_string(i) + "]";
        if (!row.is_array()) {
            return DecodeError::type_mismatch(where, "array", describe(row));
        }
        auto fields = extract(row, slots);
        if (auto *err = std::get_if<DecodeError>(&fields)) {
            return std::move(err->within(where));
        }
        out.push_back(build(std::get<Fields>(fields)));
    }
    return std::nullopt;
}

MaybeError read_uint_list(const json &obj, const char *key, std::vector<std::uint32_t> &out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        out.clear();
        return std::nullopt;
    }
    if (!it->is_array()) {
        return DecodeError::type_mismatch(key, "array", describe(*it));
    }
    out.reserve(it->size());
    for (size_t i = 0; i < it->size(); ++i) {
        const std::string name = std::string(key) + "[" + std::to_string(i) + "]";
        auto coerced = coerce_field((*it)[i], SlotType::UInt32, name);
        if (auto *err = std::get_if<DecodeError>(&coerced)) {
            return std::move(*err);
        }
        out.push_back(value_as<std::uint32_t>(std::get<SlotValue>(coerced)));
    }
    return std::nullopt;
}

MaybeError read_sensor_header(const json &obj, std::string &serial_number, std::string &hub_sn) {
    if (auto err = read_string(obj, "serial_number", serial_number)) {
        return err;
    }
    return read_string(obj, "hub_sn", hub_sn);
}

AirObservation build_air(const Fields &f) {
    AirObservation ob;
    ob.epoch = f.get<std::uint64_t>(0);
    ob.station_pressure = f.get<double>(1);
    ob.air_temperature = f.get<double>(2);
    ob.relative_humidity = f.get<double>(3);
    ob.lightning_strike_count = f.get<std::uint32_t>(4);
    ob.lightning_strike_avg_distance = f.get<std::uint32_t>(5);
    ob.battery = f.get<double>(6);
    ob.report_interval = f.get_optional<std::uint32_t>(7);
    return ob;
}

SkyObservation build_sky(const Fields &f) {
    SkyObservation ob;
    ob.epoch = f.get<std::uint64_t>(0);
    ob.illuminance = f.get<std::uint32_t>(1);
    ob.uv = f.get<double>(2);
    ob.rain_minute = f.get<double>(3);
    ob.wind_lull = f.get<double>(4);
    ob.wind_avg = f.get<double>(5);
    ob.wind_gust = f.get<double>(6);
    ob.wind_direction = f.get<std::uint32_t>(7);
    ob.battery = f.get<double>(8);
    ob.report_interval = f.get<std::uint32_t>(9);
    ob.solar_radiation = f.get<std::uint32_t>(10);
    ob.rain_day = f.get_optional<double>(11);
    ob.precipitation_type = f.get_optional<std::uint8_t>(12);
    ob.wind_sample_interval = f.get_optional<std::uint32_t>(13);
    return ob;
}

TempestObservation build_tempest(const Fields &f) {
    TempestObservation ob;
    ob.epoch = f.get<std::uint64_t>(0);
    ob.wind_lull = f.get<double>(1);
    ob.wind_avg = f.get<double>(2);
    ob.wind_gust = f.get<double>(3);
    ob.wind_direction = f.get<std::uint32_t>(4);
    ob.wind_sample_interval = f.get<std::uint32_t>(5);
    ob.station_pressure = f.get<double>(6);
    ob.air_temperature = f.get<double>(7);
    ob.relative_humidity = f.get<double>(8);
    ob.illuminance = f.get<std::uint32_t>(9);
    ob.uv = f.get<double>(10);
    ob.solar_radiation = f.get<std::uint32_t>(11);
    ob.rain_minute = f.get<double>(12);
    ob.precipitation_type = f.get<std::uint8_t>(13);
    ob.lightning_strike_avg_distance = f.get<std::uint32_t>(14);
    ob.lightning_strike_count = f.get<std::uint32_t>(15);
    ob.battery = f.get<double>(16);
    ob.report_interval = f.get_optional<std::uint32_t>(17);
    ob.local_day_rain_accumulation = f.get_optional<double>(18);
    ob.rain_accumulation_final = f.get_optional<double>(19);
    ob.local_day_rain_accumulation_final = f.get_optional<double>(20);
    ob.precipitation_analysis_type = f.get_optional<std::uint8_t>(21);
    return ob;
}

} // namespace

SchemaResult<EvtPrecip> decode_evt_precip(const json &envelope) {
    EvtPrecip rec;
    if (auto err = read_sensor_header(envelope, rec.serial_number, rec.hub_sn)) {
        return *std::move(err);
    }
    std::optional<Fields> evt;
    if (auto err = extract_payload(envelope, "evt", kPrecipEventSlots, evt)) {
        return *std::move(err);
    }
    rec.evt.epoch = evt->get<std::uint64_t>(0);
    return rec;
}

SchemaResult<EvtStrike> decode_evt_strike(const json &envelope) {
    EvtStrike rec;
    if (auto err = read_sensor_header(envelope, rec.serial_number, rec.hub_sn)) {
        return *std::move(err);
    }
    std::optional<Fields> evt;
    if (auto err = extract_payload(envelope, "evt", kStrikeEventSlots, evt)) {
        return *std::move(err);
    }
    rec.evt.epoch = evt->get<std::uint64_t>(0);
    rec.evt.distance = evt->get<std::uint16_t>(1);
    rec.evt.energy = evt->get<std::uint32_t>(2);
    return rec;
}

SchemaResult<RapidWind> decode_rapid_wind(const json &envelope) {
    RapidWind rec;
    if (auto err = read_sensor_header(envelope, rec.serial_number, rec.hub_sn)) {
        return *std::move(err);
    }
    std::optional<Fields> ob;
    if (auto err = extract_payload(envelope, "ob", kRapidWindSlots, ob)) {
        return *std::move(err);
    }
    rec.ob.epoch = ob->get<std::uint64_t>(0);
    rec.ob.wind_speed = ob->get<double>(1);
    rec.ob.wind_direction = ob->get<std::uint32_t>(2);
    return rec;
}

SchemaResult<ObsAir> decode_obs_air(const json &envelope) {
    ObsAir rec;
    if (auto err = read_sensor_header(envelope, rec.serial_number, rec.hub_sn)) {
        return *std::move(err);
    }
    if (auto err = extract_rows(envelope, kAirObservationSlots, build_air, rec.obs)) {
        return *std::move(err);
    }
    if (auto err = read_optional_scalar(envelope, "firmware_revision", SlotType::UInt32,
                                        rec.firmware_revision)) {
        return *std::move(err);
    }
    return rec;
}

SchemaResult<ObsSky> decode_obs_sky(const json &envelope) {
    ObsSky rec;
    if (auto err = read_sensor_header(envelope, rec.serial_number, rec.hub_sn)) {
        return *std::move(err);
    }
    if (auto err = extract_rows(envelope, kSkyObservationSlots, build_sky, rec.obs)) {
        return *std::move(err);
    }
    if (auto err = read_optional_scalar(envelope, "firmware_revision", SlotType::UInt32,
                                        rec.firmware_revision)) {
        return *std::move(err);
    }
    return rec;
}

SchemaResult<ObsSt> decode_obs_st(const json &envelope) {
    ObsSt rec;
    if (auto err = read_sensor_header(envelope, rec.serial_number, rec.hub_sn)) {
        return *std::move(err);
    }
    if (auto err = extract_rows(envelope, kTempestObservationSlots, build_tempest, rec.obs)) {
        return *std::move(err);
    }
    if (auto err = read_optional_scalar(envelope, "firmware_revision", SlotType::UInt32,
                                        rec.firmware_revision)) {
        return *std::move(err);
    }
    return rec;
}

SchemaResult<DeviceStatus> decode_device_status(const json &envelope) {
    DeviceStatus rec;
    MaybeError err = read_sensor_header(envelope, rec.serial_number, rec.hub_sn);
    if (!err) err = read_scalar(envelope, "timestamp", SlotType::Epoch, rec.timestamp);
    if (!err) err = read_scalar(envelope, "uptime", SlotType::UInt32, rec.uptime);
    if (!err) err = read_scalar(envelope, "voltage", SlotType::Float, rec.voltage);
    if (!err) {
        err = read_scalar(envelope, "firmware_revision", SlotType::UInt32, rec.firmware_revision);
    }
    if (!err) err = read_scalar(envelope, "rssi", SlotType::Int32, rec.rssi);
    if (!err) err = read_scalar(envelope, "hub_rssi", SlotType::Int32, rec.hub_rssi);
    if (!err) err = read_scalar(envelope, "sensor_status", SlotType::UInt32, rec.sensor_status);
    if (!err) err = read_scalar(envelope, "debug", SlotType::UInt32, rec.debug);
    if (err) {
        return *std::move(err);
    }
    return rec;
}

SchemaResult<HubStatus> decode_hub_status(const json &envelope) {
    HubStatus rec;
    MaybeError err = read_string(envelope, "serial_number", rec.serial_number);
    if (!err) err = read_string(envelope, "firmware_revision", rec.firmware_revision);
    if (!err) err = read_scalar(envelope, "uptime", SlotType::UInt32, rec.uptime);
    if (!err) err = read_scalar(envelope, "rssi", SlotType::Int32, rec.rssi);
    if (!err) err = read_scalar(envelope, "timestamp", SlotType::Epoch, rec.timestamp);
    if (!err) err = read_string(envelope, "reset_flags", rec.reset_flags);
    if (!err) err = read_scalar(envelope, "seq", SlotType::UInt32, rec.seq);
    if (!err) err = read_uint_list(envelope, "fs", rec.fs);
    if (!err) err = read_uint_list(envelope, "mqtt_stats", rec.mqtt_stats);
    if (err) {
        return *std::move(err);
    }

    std::optional<Fields> radio;
    if (auto radio_err = extract_payload(envelope, "radio_stats", kRadioStatsSlots, radio)) {
        return *std::move(radio_err);
    }
    rec.radio_stats.version = radio->get<std::uint32_t>(0);
    rec.radio_stats.reboot_count = radio->get<std::uint32_t>(1);
    rec.radio_stats.i2c_bus_error_count = radio->get<std::uint32_t>(2);
    rec.radio_stats.radio_status = radio->get<std::uint8_t>(3);
    rec.radio_stats.radio_network_id = radio->get<std::uint32_t>(4);
    return rec;
}

SchemaResult<UnknownMessage> decode_unknown(const json &envelope) {
    UnknownMessage rec;
    if (auto err = read_string(envelope, "type", rec.type)) {
        return *std::move(err);
    }
    auto serial = envelope.find("serial_number");
    if (serial != envelope.end() && serial->is_string()) {
        rec.serial_number = serial->get<std::string>();
    }
    auto hub = envelope.find("hub_sn");
    if (hub != envelope.end() && hub->is_string()) {
        rec.hub_sn = hub->get<std::string>();
    }
    rec.payload = envelope;
    return rec;
}

} // namespace tempest::protocol
