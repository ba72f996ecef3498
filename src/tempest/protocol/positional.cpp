#include "tempest/protocol/positional.hpp"

#include <limits>

namespace tempest::protocol {

namespace {

std::uint64_t unsigned_max(SlotType type) {
    switch (type) {
    case SlotType::UInt8:
        return std::numeric_limits<std::uint8_t>::max();
    case SlotType::UInt16:
        return std::numeric_limits<std::uint16_t>::max();
    case SlotType::UInt32:
        return std::numeric_limits<std::uint32_t>::max();
    default:
        return std::numeric_limits<std::uint64_t>::max();
    }
}

DecodeError mismatch(std::string_view name, SlotType type, std::string actual) {
    return DecodeError::type_mismatch(std::string(name), to_string(type), std::move(actual));
}

} // namespace

const char *to_string(SlotType type) {
    switch (type) {
    case SlotType::Epoch:
        return "epoch";
    case SlotType::Float:
        return "float";
    case SlotType::UInt8:
        return "uint8";
    case SlotType::UInt16:
        return "uint16";
    case SlotType::UInt32:
        return "uint32";
    case SlotType::Int32:
        return "int32";
    }
    return "unknown";
}

std::string describe(const nlohmann::json &value) {
    if (value.is_number_float()) {
        return "float";
    }
    if (value.is_number_integer()) {
        return "integer";
    }
    return value.type_name();
}

CoerceResult coerce_field(const nlohmann::json &value, SlotType type, std::string_view name) {
    if (type == SlotType::Float) {
        if (!value.is_number()) {
            return mismatch(name, type, describe(value));
        }
        return SlotValue{value.get<double>()};
    }

    // All remaining types are integral: floats are never truncated.
    if (!value.is_number_integer()) {
        return mismatch(name, type, describe(value));
    }

    if (type == SlotType::Int32) {
        if (value.is_number_unsigned()) {
            const auto u = value.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
                return mismatch(name, type, "integer out of range");
            }
            return SlotValue{static_cast<std::int64_t>(u)};
        }
        const auto i = value.get<std::int64_t>();
        if (i < std::numeric_limits<std::int32_t>::min() ||
            i > std::numeric_limits<std::int32_t>::max()) {
            return mismatch(name, type, "integer out of range");
        }
        return SlotValue{i};
    }

    std::uint64_t u = 0;
    if (value.is_number_unsigned()) {
        u = value.get<std::uint64_t>();
    } else {
        const auto i = value.get<std::int64_t>();
        if (i < 0) {
            return mismatch(name, type, "negative integer");
        }
        u = static_cast<std::uint64_t>(i);
    }
    if (u > unsigned_max(type)) {
        return mismatch(name, type, "integer out of range");
    }
    return SlotValue{u};
}

ExtractResult extract(const nlohmann::json &raw_array, std::span<const PositionalSlot> slots) {
    const size_t minimum = minimum_arity(slots);
    const size_t length = raw_array.size();
    if (length < minimum) {
        return DecodeError::arity_too_small(minimum, length);
    }

    std::vector<SlotValue> values;
    values.reserve(slots.size());

    for (const auto &slot : slots) {
        if (slot.index >= length) {
            if (!slot.optional) {
                return DecodeError::missing_field(std::string(slot.name));
            }
            values.emplace_back(std::monostate{});
            continue;
        }

        const auto &raw = raw_array[slot.index];
        if (raw.is_null()) {
            if (slot.optional || slot.nullable) {
                values.emplace_back(std::monostate{});
                continue;
            }
            return mismatch(slot.name, slot.type, "null");
        }

        auto coerced = coerce_field(raw, slot.type, slot.name);
        if (auto *err = std::get_if<DecodeError>(&coerced)) {
            return std::move(*err);
        }
        values.push_back(std::get<SlotValue>(coerced));
    }

    return Fields(std::move(values));
}

} // namespace tempest::protocol
