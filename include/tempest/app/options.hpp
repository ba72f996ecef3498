#pragma once

#include "tempest/protocol/cloud_client.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tempest::app {

/// How each received envelope is shown.
enum class DisplayMode {
    Struct, // decode into a Record
    Parsed, // parse into generic JSON only
    Raw,    // print the text as received
};

struct Options {
    std::optional<std::size_t> count; // stop after this many envelopes
    std::size_t bufsize = 400;
    std::string addr = "0.0.0.0:50222";
    DisplayMode mode = DisplayMode::Struct;
    std::optional<std::string> token;       // cloud API token
    std::optional<std::uint64_t> device_id; // selects the cloud source instead of UDP
    bool rapid_wind = false; // also subscribe to the cloud rapid wind stream
    std::string cloud_url = protocol::CloudClient::kDefaultUrl;
    bool help = false;
};

/// Parse command-line arguments (without argv[0]).
/// Throws std::invalid_argument on unknown flags or bad values.
Options parse_options(const std::vector<std::string> &args);

/// Split "host:port". Throws std::invalid_argument if either part is bad.
std::pair<std::string, std::uint16_t> split_address(std::string_view addr);

DisplayMode parse_mode(std::string_view mode);
const char *to_string(DisplayMode mode);

std::string usage(std::string_view program);

} // namespace tempest::app
