#include "tempest/app/options.hpp"

#include <charconv>
#include <limits>
#include <stdexcept>

namespace tempest::app {

namespace {

template <typename T> T parse_number(std::string_view flag, std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::invalid_argument("invalid value for " + std::string(flag) + ": '" +
                                    std::string(text) + "'");
    }
    return value;
}

} // namespace

Options parse_options(const std::vector<std::string> &args) {
    Options opts;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::optional<std::string> inline_value;
        if (flag.rfind("--", 0) == 0) {
            auto eq = flag.find('=');
            if (eq != std::string::npos) {
                inline_value = flag.substr(eq + 1);
                flag.resize(eq);
            }
        }

        auto value = [&]() -> std::string {
            if (inline_value) {
                return *inline_value;
            }
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("missing value for " + flag);
            }
            return args[++i];
        };

        if (flag == "-h" || flag == "--help") {
            opts.help = true;
        } else if (flag == "-c" || flag == "--count") {
            opts.count = parse_number<std::size_t>(flag, value());
        } else if (flag == "-b" || flag == "--bufsize") {
            opts.bufsize = parse_number<std::size_t>(flag, value());
            if (opts.bufsize == 0) {
                throw std::invalid_argument("--bufsize must be positive");
            }
        } else if (flag == "-a" || flag == "--addr") {
            opts.addr = value();
            split_address(opts.addr); // validate early
        } else if (flag == "-m" || flag == "--mode") {
            opts.mode = parse_mode(value());
        } else if (flag == "--token") {
            opts.token = value();
        } else if (flag == "--device-id") {
            opts.device_id = parse_number<std::uint64_t>(flag, value());
        } else if (flag == "--rapid-wind") {
            opts.rapid_wind = true;
        } else if (flag == "--cloud-url") {
            opts.cloud_url = value();
        } else {
            throw std::invalid_argument("unknown option '" + args[i] + "'");
        }
    }

    return opts;
}

std::pair<std::string, std::uint16_t> split_address(std::string_view addr) {
    const auto colon = addr.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == addr.size()) {
        throw std::invalid_argument("address must be host:port, got '" + std::string(addr) + "'");
    }
    const auto port = parse_number<std::uint32_t>("port", addr.substr(colon + 1));
    if (port > std::numeric_limits<std::uint16_t>::max()) {
        throw std::invalid_argument("port out of range: " + std::to_string(port));
    }
    return {std::string(addr.substr(0, colon)), static_cast<std::uint16_t>(port)};
}

DisplayMode parse_mode(std::string_view mode) {
    if (mode == "struct") {
        return DisplayMode::Struct;
    }
    if (mode == "parsed") {
        return DisplayMode::Parsed;
    }
    if (mode == "raw") {
        return DisplayMode::Raw;
    }
    throw std::invalid_argument("unknown mode '" + std::string(mode) +
                                "' (expected struct, parsed or raw)");
}

const char *to_string(DisplayMode mode) {
    switch (mode) {
    case DisplayMode::Struct:
        return "struct";
    case DisplayMode::Parsed:
        return "parsed";
    case DisplayMode::Raw:
        return "raw";
    }
    return "struct";
}

std::string usage(std::string_view program) {
    std::string out = "Usage: " + std::string(program) + " [options]\n";
    out += "Read WeatherFlow Tempest JSON envelopes and display the decoded data.\n"
           "By default listens for hub broadcasts on 0.0.0.0:50222.\n\n"
           "  -c, --count N        exit after N envelopes\n"
           "  -b, --bufsize N      datagram buffer size in bytes (default 400)\n"
           "  -a, --addr HOST:PORT listen address (default 0.0.0.0:50222)\n"
           "  -m, --mode MODE      struct | parsed | raw (default struct)\n"
           "      --device-id N    read device N from the cloud API instead of UDP\n"
           "      --token T        cloud API token (default: $TEMPEST_TOKEN)\n"
           "      --rapid-wind     also subscribe to cloud rapid wind\n"
           "      --cloud-url URL  cloud WebSocket endpoint\n"
           "  -h, --help           show this help\n";
    return out;
}

} // namespace tempest::app
