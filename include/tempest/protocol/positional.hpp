#pragma once

#include "tempest/protocol/decode_error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tempest::protocol {

/// Wire value types. Each has one coercion rule (see coerce_field).
enum class SlotType : std::uint8_t {
    Epoch,  // unix seconds, non-negative integer
    Float,  // any JSON number, widened to double
    UInt8,
    UInt16,
    UInt32,
    Int32,
};

const char *to_string(SlotType type);

/// One element of a positional array payload.
/// `optional`: may be missing from the tail of the array.
/// `nullable`: may be present as null (read back as unset).
struct PositionalSlot {
    std::size_t index;
    std::string_view name;
    SlotType type;
    bool optional = false;
    bool nullable = false;
};

/// Optional slots must form a contiguous suffix and every index must match
/// its position in the schema.
constexpr bool is_well_formed(std::span<const PositionalSlot> slots) {
    bool seen_optional = false;
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].index != i) {
            return false;
        }
        if (slots[i].optional) {
            seen_optional = true;
        } else if (seen_optional) {
            return false;
        }
    }
    return true;
}

/// Number of leading required slots.
constexpr std::size_t minimum_arity(std::span<const PositionalSlot> slots) {
    std::size_t n = 0;
    while (n < slots.size() && !slots[n].optional) {
        ++n;
    }
    return n;
}

/// A coerced value: unset, unsigned, signed, or floating point.
using SlotValue = std::variant<std::monostate, std::uint64_t, std::int64_t, double>;

/// Convert a coerced value to T. Unset converts to T{}.
template <typename T> [[nodiscard]] T value_as(const SlotValue &value) {
    return std::visit(
        [](const auto &v) -> T {
            if constexpr (std::is_same_v<std::decay_t<decltype(v)>, std::monostate>) {
                return T{};
            } else {
                return static_cast<T>(v);
            }
        },
        value);
}

/// Owned result of an extraction: one value per slot, in schema order.
class Fields {
  public:
    explicit Fields(std::vector<SlotValue> values) : values_(std::move(values)) {}

    [[nodiscard]] size_t size() const { return values_.size(); }
    [[nodiscard]] bool has(size_t i) const {
        return i < values_.size() && !std::holds_alternative<std::monostate>(values_[i]);
    }

    /// Value of slot i converted to T. Precondition: has(i).
    template <typename T> [[nodiscard]] T get(size_t i) const { return value_as<T>(values_[i]); }

    template <typename T> [[nodiscard]] std::optional<T> get_optional(size_t i) const {
        if (!has(i)) {
            return std::nullopt;
        }
        return get<T>(i);
    }

  private:
    std::vector<SlotValue> values_;
};

using ExtractResult = std::variant<Fields, DecodeError>;
using CoerceResult = std::variant<SlotValue, DecodeError>;

/// Coerce a single JSON value to `type`. Null is rejected here; callers decide
/// whether a null is acceptable for their field.
CoerceResult coerce_field(const nlohmann::json &value, SlotType type, std::string_view name);

/// Extract every slot of `slots` from `raw_array` by index.
///
/// - Fails with ArityTooSmall if fewer than minimum_arity(slots) elements exist.
/// - Missing optional slots and nulls in optional/nullable slots are unset.
/// - A required slot beyond the end of the array fails with MissingField.
/// - Elements past the last slot are ignored.
/// - A value that does not coerce fails with TypeMismatch.
///
/// Precondition: raw_array.is_array().
ExtractResult extract(const nlohmann::json &raw_array, std::span<const PositionalSlot> slots);

/// Human-readable JSON shape of a value, used in TypeMismatch errors.
std::string describe(const nlohmann::json &value);

} // namespace tempest::protocol
