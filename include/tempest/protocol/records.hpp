#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tempest::protocol {

// --- Positional payloads -------------------------------------------------
// Units are the wire's native units; no conversion is applied.

/// Rain start event detail, "evt":[epoch].
struct PrecipEvent {
    std::uint64_t epoch = 0;
};

/// Lightning strike event detail, "evt":[epoch, distance, energy].
struct StrikeEvent {
    std::uint64_t epoch = 0;
    std::uint16_t distance = 0; // km
    std::uint32_t energy = 0;
};

/// Rapid wind sample, "ob":[epoch, speed, direction].
struct RapidWindSample {
    std::uint64_t epoch = 0;
    double wind_speed = 0.0;          // m/s
    std::uint32_t wind_direction = 0; // degrees
};

/// One row of an AIR observation.
struct AirObservation {
    std::uint64_t epoch = 0;
    double station_pressure = 0.0; // mb
    double air_temperature = 0.0;  // C
    double relative_humidity = 0.0;
    std::uint32_t lightning_strike_count = 0;
    std::uint32_t lightning_strike_avg_distance = 0; // km
    double battery = 0.0;                             // V
    std::optional<std::uint32_t> report_interval;     // minutes
};

/// One row of a SKY observation.
struct SkyObservation {
    std::uint64_t epoch = 0;
    std::uint32_t illuminance = 0; // lux
    double uv = 0.0;
    double rain_minute = 0.0; // mm over the report interval
    double wind_lull = 0.0;   // m/s, minimum 3 second sample
    double wind_avg = 0.0;
    double wind_gust = 0.0; // m/s, maximum 3 second sample
    std::uint32_t wind_direction = 0;
    double battery = 0.0;
    std::uint32_t report_interval = 0;
    std::uint32_t solar_radiation = 0; // W/m^2
    std::optional<double> rain_day;    // null on current firmware
    std::optional<std::uint8_t> precipitation_type; // 0 none, 1 rain, 2 hail
    std::optional<std::uint32_t> wind_sample_interval; // seconds
};

/// One row of a Tempest (ST) observation.
struct TempestObservation {
    std::uint64_t epoch = 0;
    double wind_lull = 0.0;
    double wind_avg = 0.0;
    double wind_gust = 0.0;
    std::uint32_t wind_direction = 0;
    std::uint32_t wind_sample_interval = 0;
    double station_pressure = 0.0;
    double air_temperature = 0.0;
    double relative_humidity = 0.0;
    std::uint32_t illuminance = 0;
    double uv = 0.0;
    std::uint32_t solar_radiation = 0;
    double rain_minute = 0.0;
    std::uint8_t precipitation_type = 0; // 0 none, 1 rain, 2 hail, 3 rain + hail
    std::uint32_t lightning_strike_avg_distance = 0;
    std::uint32_t lightning_strike_count = 0;
    double battery = 0.0;
    std::optional<std::uint32_t> report_interval;
    // Appended by the cloud API.
    std::optional<double> local_day_rain_accumulation;
    std::optional<double> rain_accumulation_final;
    std::optional<double> local_day_rain_accumulation_final;
    std::optional<std::uint8_t> precipitation_analysis_type;
};

/// Hub radio statistics, "radio_stats":[version, reboots, i2c errors, status, network id].
struct RadioStats {
    std::uint32_t version = 0;
    std::uint32_t reboot_count = 0;
    std::uint32_t i2c_bus_error_count = 0;
    std::uint8_t radio_status = 0;
    std::uint32_t radio_network_id = 0;
};

// --- Variants --------------------------------------------------------------

struct EvtPrecip {
    std::string serial_number;
    std::string hub_sn;
    PrecipEvent evt;
};

struct EvtStrike {
    std::string serial_number;
    std::string hub_sn;
    StrikeEvent evt;
};

struct RapidWind {
    std::string serial_number;
    std::string hub_sn;
    RapidWindSample ob;
};

struct ObsAir {
    std::string serial_number;
    std::string hub_sn;
    std::vector<AirObservation> obs;
    std::optional<std::uint32_t> firmware_revision;
};

struct ObsSky {
    std::string serial_number;
    std::string hub_sn;
    std::vector<SkyObservation> obs;
    std::optional<std::uint32_t> firmware_revision;
};

struct ObsSt {
    std::string serial_number;
    std::string hub_sn;
    std::vector<TempestObservation> obs;
    std::optional<std::uint32_t> firmware_revision;
};

/// Sensor status report. sensor_status is an opaque bitmask.
struct DeviceStatus {
    std::string serial_number;
    std::string hub_sn;
    std::uint64_t timestamp = 0;
    std::uint32_t uptime = 0; // seconds
    double voltage = 0.0;
    std::uint32_t firmware_revision = 0;
    std::int32_t rssi = 0;
    std::int32_t hub_rssi = 0;
    std::uint32_t sensor_status = 0;
    std::uint32_t debug = 0;
};

/// Hub status report. The hub is its own serial; there is no hub_sn.
struct HubStatus {
    std::string serial_number;
    std::string firmware_revision;
    std::uint32_t uptime = 0;
    std::int32_t rssi = 0;
    std::uint64_t timestamp = 0;
    std::string reset_flags; // e.g. "BOR,PIN,POR"
    std::uint32_t seq = 0;
    std::vector<std::uint32_t> fs; // internal use, empty when absent
    RadioStats radio_stats;
    std::vector<std::uint32_t> mqtt_stats; // internal use, empty when absent
};

/// Any envelope whose discriminator is not one of the known eight.
/// Keeps the discriminator and an owned copy of the whole envelope.
struct UnknownMessage {
    std::string type;
    std::optional<std::string> serial_number;
    std::optional<std::string> hub_sn;
    nlohmann::json payload;
};

enum class RecordKind : std::uint8_t {
    EvtPrecip,
    EvtStrike,
    RapidWind,
    ObsAir,
    ObsSky,
    ObsSt,
    DeviceStatus,
    HubStatus,
    Unknown,
};

namespace detail {
struct RecordFactory;
}

/// A decoded envelope. Immutable; only the decoder can create one.
class Record {
  public:
    using Variant = std::variant<EvtPrecip, EvtStrike, RapidWind, ObsAir, ObsSky, ObsSt,
                                 DeviceStatus, HubStatus, UnknownMessage>;

    [[nodiscard]] const Variant &variant() const { return value_; }
    [[nodiscard]] RecordKind kind() const { return static_cast<RecordKind>(value_.index()); }

    template <typename T> [[nodiscard]] bool holds() const {
        return std::holds_alternative<T>(value_);
    }

    /// Pointer to the active variant if it is T, nullptr otherwise.
    template <typename T> [[nodiscard]] const T *get_if() const { return std::get_if<T>(&value_); }

    /// Discriminator as it appeared on the wire.
    [[nodiscard]] std::string_view type() const;

    /// Originating serial number; empty only for an unknown message without one.
    [[nodiscard]] std::string_view serial_number() const;

    /// Hub serial number, absent for hub status and some unknown messages.
    [[nodiscard]] std::optional<std::string_view> hub_sn() const;

  private:
    friend struct detail::RecordFactory;

    explicit Record(Variant value) : value_(std::move(value)) {}

    Variant value_;
};

/// Wire discriminator for a kind ("evt_precip", ...). "unknown" for RecordKind::Unknown.
const char *to_string(RecordKind kind);

} // namespace tempest::protocol
