#pragma once

#include "tempest/protocol/decode_error.hpp"
#include "tempest/protocol/records.hpp"

#include <nlohmann/json.hpp>

#include <string_view>
#include <variant>

namespace tempest::protocol {

/// Result is either a decoded record or the reason it could not be decoded.
using DecodeResult = std::variant<Record, DecodeError>;

/// Decode one envelope from its raw JSON text.
///
/// Contract:
/// - Pure: no I/O, no logging, no shared state; safe from any thread
/// - Never throws for bad input; every failure is returned as a DecodeError
/// - All-or-nothing: a Record is returned only if every required field decoded
/// - Unknown discriminators decode to UnknownMessage rather than failing
/// - The returned Record owns all of its data; `text` may be released afterwards
DecodeResult decode_envelope(std::string_view text);

/// Same as decode_envelope for an envelope that is already parsed.
/// A non-object value is Malformed.
DecodeResult decode_parsed(const nlohmann::json &envelope);

/// True if `type` is one of the eight discriminators with a dedicated schema.
bool is_known_discriminator(std::string_view type);

} // namespace tempest::protocol
