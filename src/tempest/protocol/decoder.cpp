#include "tempest/protocol/decoder.hpp"
#include "tempest/protocol/schemas.hpp"

#include <array>
#include <utility>

namespace tempest::protocol {

namespace detail {

struct RecordFactory {
    static Record make(Record::Variant value) { return Record(std::move(value)); }
};

} // namespace detail

namespace {

using nlohmann::json;
using DecodeFn = DecodeResult (*)(const json &);

template <typename T, SchemaResult<T> (*Decode)(const json &)>
DecodeResult route(const json &envelope) {
    auto result = Decode(envelope);
    if (auto *err = std::get_if<DecodeError>(&result)) {
        return std::move(*err);
    }
    return detail::RecordFactory::make(std::move(std::get<T>(result)));
}

struct Route {
    std::string_view type;
    DecodeFn decode;
};

constexpr std::array<Route, 8> kRoutes{{
    {"evt_precip", &route<EvtPrecip, decode_evt_precip>},
    {"evt_strike", &route<EvtStrike, decode_evt_strike>},
    {"rapid_wind", &route<RapidWind, decode_rapid_wind>},
    {"obs_air", &route<ObsAir, decode_obs_air>},
    {"obs_sky", &route<ObsSky, decode_obs_sky>},
    {"obs_st", &route<ObsSt, decode_obs_st>},
    {"device_status", &route<DeviceStatus, decode_device_status>},
    {"hub_status", &route<HubStatus, decode_hub_status>},
}};

constexpr DecodeFn kFallback = &route<UnknownMessage, decode_unknown>;

DecodeFn lookup(std::string_view type) {
    for (const auto &r : kRoutes) {
        if (r.type == type) {
            return r.decode;
        }
    }
    return nullptr;
}

} // namespace

DecodeResult decode_envelope(std::string_view text) {
    json envelope;
    try {
        envelope = json::parse(text.begin(), text.end());
    } catch (const json::exception &e) {
        // parse_error for bad syntax, out_of_range for number overflow (1e400).
        return DecodeError::malformed(e.what());
    }
    return decode_parsed(envelope);
}

DecodeResult decode_parsed(const json &envelope) {
    if (!envelope.is_object()) {
        return DecodeError::malformed("expected a JSON object, got " + describe(envelope));
    }

    auto it = envelope.find("type");
    if (it == envelope.end() || it->is_null()) {
        return DecodeError::missing_discriminator();
    }
    if (!it->is_string()) {
        return DecodeError::type_mismatch("type", "string", describe(*it));
    }
    const auto &type = it->get_ref<const std::string &>();
    if (type.empty()) {
        return DecodeError::missing_discriminator();
    }

    if (DecodeFn decode = lookup(type)) {
        return decode(envelope);
    }
    return kFallback(envelope);
}

bool is_known_discriminator(std::string_view type) { return lookup(type) != nullptr; }

} // namespace tempest::protocol
