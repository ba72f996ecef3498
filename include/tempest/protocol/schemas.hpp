#pragma once

#include "tempest/protocol/decode_error.hpp"
#include "tempest/protocol/positional.hpp"
#include "tempest/protocol/records.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <variant>

namespace tempest::protocol {

// --- Slot tables -------------------------------------------------------------
// Index order is the wire order documented for hub firmware v171 and the
// cloud API. Trailing optional slots absorb firmware revisions that add or
// drop fields.

inline constexpr std::array<PositionalSlot, 1> kPrecipEventSlots{{
    {0, "epoch", SlotType::Epoch},
}};

inline constexpr std::array<PositionalSlot, 3> kStrikeEventSlots{{
    {0, "epoch", SlotType::Epoch},
    {1, "distance", SlotType::UInt16},
    {2, "energy", SlotType::UInt32},
}};

inline constexpr std::array<PositionalSlot, 3> kRapidWindSlots{{
    {0, "epoch", SlotType::Epoch},
    {1, "wind_speed", SlotType::Float},
    {2, "wind_direction", SlotType::UInt32},
}};

inline constexpr std::array<PositionalSlot, 8> kAirObservationSlots{{
    {0, "epoch", SlotType::Epoch},
    {1, "station_pressure", SlotType::Float},
    {2, "air_temperature", SlotType::Float},
    {3, "relative_humidity", SlotType::Float},
    {4, "lightning_strike_count", SlotType::UInt32},
    {5, "lightning_strike_avg_distance", SlotType::UInt32},
    {6, "battery", SlotType::Float},
    {7, "report_interval", SlotType::UInt32, true},
}};

inline constexpr std::array<PositionalSlot, 14> kSkyObservationSlots{{
    {0, "epoch", SlotType::Epoch},
    {1, "illuminance", SlotType::UInt32},
    {2, "uv", SlotType::Float},
    {3, "rain_minute", SlotType::Float},
    {4, "wind_lull", SlotType::Float},
    {5, "wind_avg", SlotType::Float},
    {6, "wind_gust", SlotType::Float},
    {7, "wind_direction", SlotType::UInt32},
    {8, "battery", SlotType::Float},
    {9, "report_interval", SlotType::UInt32},
    {10, "solar_radiation", SlotType::UInt32},
    {.index = 11, .name = "rain_day", .type = SlotType::Float, .nullable = true},
    {12, "precipitation_type", SlotType::UInt8, true},
    {13, "wind_sample_interval", SlotType::UInt32, true},
}};

inline constexpr std::array<PositionalSlot, 22> kTempestObservationSlots{{
    {0, "epoch", SlotType::Epoch},
    {1, "wind_lull", SlotType::Float},
    {2, "wind_avg", SlotType::Float},
    {3, "wind_gust", SlotType::Float},
    {4, "wind_direction", SlotType::UInt32},
    {5, "wind_sample_interval", SlotType::UInt32},
    {6, "station_pressure", SlotType::Float},
    {7, "air_temperature", SlotType::Float},
    {8, "relative_humidity", SlotType::Float},
    {9, "illuminance", SlotType::UInt32},
    {10, "uv", SlotType::Float},
    {11, "solar_radiation", SlotType::UInt32},
    {12, "rain_minute", SlotType::Float},
    {13, "precipitation_type", SlotType::UInt8},
    {14, "lightning_strike_avg_distance", SlotType::UInt32},
    {15, "lightning_strike_count", SlotType::UInt32},
    {16, "battery", SlotType::Float},
    {17, "report_interval", SlotType::UInt32, true},
    {18, "local_day_rain_accumulation", SlotType::Float, true},
    {19, "rain_accumulation_final", SlotType::Float, true},
    {20, "local_day_rain_accumulation_final", SlotType::Float, true},
    {21, "precipitation_analysis_type", SlotType::UInt8, true},
}};

inline constexpr std::array<PositionalSlot, 5> kRadioStatsSlots{{
    {0, "version", SlotType::UInt32},
    {1, "reboot_count", SlotType::UInt32},
    {2, "i2c_bus_error_count", SlotType::UInt32},
    {3, "radio_status", SlotType::UInt8},
    {4, "radio_network_id", SlotType::UInt32},
}};

static_assert(is_well_formed(kPrecipEventSlots));
static_assert(is_well_formed(kStrikeEventSlots));
static_assert(is_well_formed(kRapidWindSlots));
static_assert(is_well_formed(kAirObservationSlots));
static_assert(is_well_formed(kSkyObservationSlots));
static_assert(is_well_formed(kTempestObservationSlots));
static_assert(is_well_formed(kRadioStatsSlots));

// --- Variant decoders ----------------------------------------------------------
// Each takes the parsed envelope object and has no side effects. The
// discriminator is not re-checked; dispatch is the classifier's job.

template <typename T> using SchemaResult = std::variant<T, DecodeError>;

SchemaResult<EvtPrecip> decode_evt_precip(const nlohmann::json &envelope);
SchemaResult<EvtStrike> decode_evt_strike(const nlohmann::json &envelope);
SchemaResult<RapidWind> decode_rapid_wind(const nlohmann::json &envelope);
SchemaResult<ObsAir> decode_obs_air(const nlohmann::json &envelope);
SchemaResult<ObsSky> decode_obs_sky(const nlohmann::json &envelope);
SchemaResult<ObsSt> decode_obs_st(const nlohmann::json &envelope);
SchemaResult<DeviceStatus> decode_device_status(const nlohmann::json &envelope);
SchemaResult<HubStatus> decode_hub_status(const nlohmann::json &envelope);
SchemaResult<UnknownMessage> decode_unknown(const nlohmann::json &envelope);

} // namespace tempest::protocol
