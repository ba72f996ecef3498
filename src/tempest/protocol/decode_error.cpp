#include "tempest/protocol/decode_error.hpp"

#include <utility>

namespace tempest::protocol {

DecodeError DecodeError::malformed(std::string detail) {
    DecodeError err;
    err.kind = DecodeErrorKind::Malformed;
    err.detail = std::move(detail);
    return err;
}

DecodeError DecodeError::missing_discriminator() {
    DecodeError err;
    err.kind = DecodeErrorKind::MissingDiscriminator;
    err.field = "type";
    return err;
}

DecodeError DecodeError::missing_field(std::string field) {
    DecodeError err;
    err.kind = DecodeErrorKind::MissingField;
    err.field = std::move(field);
    return err;
}

DecodeError DecodeError::type_mismatch(std::string field, std::string expected,
                                       std::string actual) {
    DecodeError err;
    err.kind = DecodeErrorKind::TypeMismatch;
    err.field = std::move(field);
    err.expected = std::move(expected);
    err.actual = std::move(actual);
    return err;
}

DecodeError DecodeError::arity_too_small(std::size_t minimum, std::size_t length) {
    DecodeError err;
    err.kind = DecodeErrorKind::ArityTooSmall;
    err.minimum = minimum;
    err.length = length;
    return err;
}

DecodeError &DecodeError::within(const std::string &container) {
    if (field.empty()) {
        field = container;
    } else {
        field = container + "." + field;
    }
    return *this;
}

const char *to_string(DecodeErrorKind kind) {
    switch (kind) {
    case DecodeErrorKind::Malformed:
        return "malformed";
    case DecodeErrorKind::MissingDiscriminator:
        return "missing_discriminator";
    case DecodeErrorKind::MissingField:
        return "missing_field";
    case DecodeErrorKind::TypeMismatch:
        return "type_mismatch";
    case DecodeErrorKind::ArityTooSmall:
        return "arity_too_small";
    }
    return "unknown";
}

std::string to_string(const DecodeError &error) {
    std::string out = to_string(error.kind);
    switch (error.kind) {
    case DecodeErrorKind::Malformed:
        if (!error.detail.empty()) {
            out += ": " + error.detail;
        }
        break;
    case DecodeErrorKind::MissingDiscriminator:
        out += ": envelope has no 'type'";
        break;
    case DecodeErrorKind::MissingField:
        out += ": " + error.field;
        break;
    case DecodeErrorKind::TypeMismatch:
        out += ": " + error.field + " expected " + error.expected + ", got " + error.actual;
        break;
    case DecodeErrorKind::ArityTooSmall:
        out += ": ";
        if (!error.field.empty()) {
            out += error.field + " ";
        }
        out += "needs at least " + std::to_string(error.minimum) + " elements, got " +
               std::to_string(error.length);
        break;
    }
    return out;
}

} // namespace tempest::protocol
