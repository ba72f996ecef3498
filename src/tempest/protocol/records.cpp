#include "tempest/protocol/records.hpp"

namespace tempest::protocol {

namespace {

template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::string_view Record::type() const {
    if (const auto *unknown = std::get_if<UnknownMessage>(&value_)) {
        return unknown->type;
    }
    return to_string(kind());
}

std::string_view Record::serial_number() const {
    return std::visit(Overloaded{
                          [](const UnknownMessage &m) -> std::string_view {
                              return m.serial_number ? std::string_view(*m.serial_number)
                                                     : std::string_view{};
                          },
                          [](const auto &m) -> std::string_view { return m.serial_number; },
                      },
                      value_);
}

std::optional<std::string_view> Record::hub_sn() const {
    return std::visit(Overloaded{
                          [](const UnknownMessage &m) -> std::optional<std::string_view> {
                              if (!m.hub_sn) {
                                  return std::nullopt;
                              }
                              return std::string_view(*m.hub_sn);
                          },
                          [](const HubStatus &) -> std::optional<std::string_view> {
                              return std::nullopt;
                          },
                          [](const auto &m) -> std::optional<std::string_view> {
                              return std::string_view(m.hub_sn);
                          },
                      },
                      value_);
}

const char *to_string(RecordKind kind) {
    switch (kind) {
    case RecordKind::EvtPrecip:
        return "evt_precip";
    case RecordKind::EvtStrike:
        return "evt_strike";
    case RecordKind::RapidWind:
        return "rapid_wind";
    case RecordKind::ObsAir:
        return "obs_air";
    case RecordKind::ObsSky:
        return "obs_sky";
    case RecordKind::ObsSt:
        return "obs_st";
    case RecordKind::DeviceStatus:
        return "device_status";
    case RecordKind::HubStatus:
        return "hub_status";
    case RecordKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

} // namespace tempest::protocol
