#include "tempest/protocol/serialize.hpp"
#include "tempest/protocol/schemas.hpp"

#include <optional>
#include <span>
#include <vector>

namespace tempest::protocol {

namespace {

using nlohmann::json;

template <typename T> json opt(const std::optional<T> &value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

json positional(std::vector<json> values, std::span<const PositionalSlot> slots) {
    const size_t minimum = minimum_arity(slots);
    while (values.size() > minimum && values.back().is_null()) {
        values.pop_back();
    }
    return json(std::move(values));
}

json header(const char *type, const std::string &serial_number, const std::string &hub_sn) {
    return json{{"type", type}, {"serial_number", serial_number}, {"hub_sn", hub_sn}};
}

json row(const AirObservation &ob) {
    return positional({ob.epoch, ob.station_pressure, ob.air_temperature, ob.relative_humidity,
                       ob.lightning_strike_count, ob.lightning_strike_avg_distance, ob.battery,
                       opt(ob.report_interval)},
                      kAirObservationSlots);
}

json row(const SkyObservation &ob) {
    return positional({ob.epoch, ob.illuminance, ob.uv, ob.rain_minute, ob.wind_lull, ob.wind_avg,
                       ob.wind_gust, ob.wind_direction, ob.battery, ob.report_interval,
                       ob.solar_radiation, opt(ob.rain_day), opt(ob.precipitation_type),
                       opt(ob.wind_sample_interval)},
                      kSkyObservationSlots);
}

json row(const TempestObservation &ob) {
    return positional({ob.epoch,
                       ob.wind_lull,
                       ob.wind_avg,
                       ob.wind_gust,
                       ob.wind_direction,
                       ob.wind_sample_interval,
                       ob.station_pressure,
                       ob.air_temperature,
                       ob.relative_humidity,
                       ob.illuminance,
                       ob.uv,
                       ob.solar_radiation,
                       ob.rain_minute,
                       ob.precipitation_type,
                       ob.lightning_strike_avg_distance,
                       ob.lightning_strike_count,
                       ob.battery,
                       opt(ob.report_interval),
                       opt(ob.local_day_rain_accumulation),
                       opt(ob.rain_accumulation_final),
                       opt(ob.local_day_rain_accumulation_final),
                       opt(ob.precipitation_analysis_type)},
                      kTempestObservationSlots);
}

template <typename Row> json rows(const std::vector<Row> &obs) {
    json out = json::array();
    for (const auto &ob : obs) {
        out.push_back(row(ob));
    }
    return out;
}

template <typename Obs> json observation(const char *type, const Obs &rec) {
    json out = header(type, rec.serial_number, rec.hub_sn);
    out["obs"] = rows(rec.obs);
    if (rec.firmware_revision) {
        out["firmware_revision"] = *rec.firmware_revision;
    }
    return out;
}

} // namespace

json to_json(const Record &record) {
    const auto &value = record.variant();

    if (const auto *m = std::get_if<EvtPrecip>(&value)) {
        json out = header("evt_precip", m->serial_number, m->hub_sn);
        out["evt"] = json::array({m->evt.epoch});
        return out;
    }
    if (const auto *m = std::get_if<EvtStrike>(&value)) {
        json out = header("evt_strike", m->serial_number, m->hub_sn);
        out["evt"] = json::array({m->evt.epoch, m->evt.distance, m->evt.energy});
        return out;
    }
    if (const auto *m = std::get_if<RapidWind>(&value)) {
        json out = header("rapid_wind", m->serial_number, m->hub_sn);
        out["ob"] = json::array({m->ob.epoch, m->ob.wind_speed, m->ob.wind_direction});
        return out;
    }
    if (const auto *m = std::get_if<ObsAir>(&value)) {
        return observation("obs_air", *m);
    }
    if (const auto *m = std::get_if<ObsSky>(&value)) {
        return observation("obs_sky", *m);
    }
    if (const auto *m = std::get_if<ObsSt>(&value)) {
        return observation("obs_st", *m);
    }
    if (const auto *m = std::get_if<DeviceStatus>(&value)) {
        json out = header("device_status", m->serial_number, m->hub_sn);
        out["timestamp"] = m->timestamp;
        out["uptime"] = m->uptime;
        out["voltage"] = m->voltage;
        out["firmware_revision"] = m->firmware_revision;
        out["rssi"] = m->rssi;
        out["hub_rssi"] = m->hub_rssi;
        out["sensor_status"] = m->sensor_status;
        out["debug"] = m->debug;
        return out;
    }
    if (const auto *m = std::get_if<HubStatus>(&value)) {
        json out;
        out["type"] = "hub_status";
        out["serial_number"] = m->serial_number;
        out["firmware_revision"] = m->firmware_revision;
        out["uptime"] = m->uptime;
        out["rssi"] = m->rssi;
        out["timestamp"] = m->timestamp;
        out["reset_flags"] = m->reset_flags;
        out["seq"] = m->seq;
        if (!m->fs.empty()) {
            out["fs"] = m->fs;
        }
        const auto &r = m->radio_stats;
        out["radio_stats"] = json::array(
            {r.version, r.reboot_count, r.i2c_bus_error_count, r.radio_status, r.radio_network_id});
        if (!m->mqtt_stats.empty()) {
            out["mqtt_stats"] = m->mqtt_stats;
        }
        return out;
    }
    return std::get<UnknownMessage>(value).payload;
}

} // namespace tempest::protocol
