#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tempest::protocol {

enum class DecodeErrorKind : std::uint8_t {
    Malformed,            // input is not a well-formed JSON object
    MissingDiscriminator, // "type" absent or empty
    MissingField,         // required header, scalar or array container absent
    TypeMismatch,         // value present with the wrong shape for its field
    ArityTooSmall,        // array payload shorter than its required prefix
};

/// Structured decode failure. Only the members relevant to `kind` are set.
struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::Malformed;
    std::string field;
    std::string expected;
    std::string actual;
    std::size_t minimum = 0;
    std::size_t length = 0;
    std::string detail;

    static DecodeError malformed(std::string detail);
    static DecodeError missing_discriminator();
    static DecodeError missing_field(std::string field);
    static DecodeError type_mismatch(std::string field, std::string expected, std::string actual);
    static DecodeError arity_too_small(std::size_t minimum, std::size_t length);

    /// Prefix the field name with its container, e.g. "uv" -> "obs[0].uv".
    DecodeError &within(const std::string &container);

    bool operator==(const DecodeError &) const = default;
};

/// Stable name of an error kind ("malformed", "missing_field", ...).
const char *to_string(DecodeErrorKind kind);

/// Single-line diagnostic, e.g. "type_mismatch: obs[0].uv expected float, got string".
std::string to_string(const DecodeError &error);

} // namespace tempest::protocol
