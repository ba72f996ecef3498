#pragma once

#include "tempest/protocol/records.hpp"

#include <nlohmann/json.hpp>

namespace tempest::protocol {

/// Re-emit a record in its wire shape.
/// Header strings are copied verbatim. Positional payloads drop trailing
/// unset optional slots; an unset nullable slot inside the array is null.
/// An UnknownMessage is emitted as the envelope it was decoded from.
nlohmann::json to_json(const Record &record);

} // namespace tempest::protocol
