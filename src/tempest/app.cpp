#include "tempest/app.hpp"
#include "tempest/net/udp_listener.hpp"
#include "tempest/protocol/decoder.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <vector>

namespace tempest {

namespace {

std::atomic<bool> g_running{true};

void on_signal(int /*signum*/) { g_running = false; }

// No SA_RESTART: a blocking recvfrom must return EINTR so the loop can exit.
void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

App::App() = default;
App::~App() = default;

int App::run(int argc, char *argv[]) {
    const std::string program = argc > 0 ? argv[0] : "tempest-listen";

    try {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }
        options_ = app::parse_options(args);
    } catch (const std::invalid_argument &e) {
        std::fprintf(stderr, "[Tempest] %s\n\n%s", e.what(), app::usage(program).c_str());
        return 2;
    }

    if (options_.help) {
        std::printf("%s", app::usage(program).c_str());
        return 0;
    }

    if (!options_.token) {
        if (const char *env = std::getenv("TEMPEST_TOKEN")) {
            options_.token = env;
        }
    }

    g_running = true;
    install_signal_handlers();

    try {
        const int rc = options_.device_id ? run_cloud() : run_udp();
        print_stats();
        return rc;
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[Tempest] Fatal: %s\n", e.what());
        return 1;
    }
}

bool App::handle(const std::string &text, const std::string &origin) {
    ++stats_.handled;

    switch (options_.mode) {
    case app::DisplayMode::Raw:
        std::printf("recv: %zu %s %s\n", text.size(), origin.c_str(), text.c_str());
        return true;

    case app::DisplayMode::Parsed: {
        auto msg = nlohmann::json::parse(text, nullptr, false);
        if (msg.is_discarded()) {
            ++stats_.failed;
            log_.add(app::ConsoleEntryType::Error, "Malformed JSON message", text, origin);
            return false;
        }
        std::printf("decoded json %s\n", msg.dump().c_str());
        return true;
    }

    case app::DisplayMode::Struct:
        break;
    }

    auto result = protocol::decode_envelope(text);
    if (const auto *err = std::get_if<protocol::DecodeError>(&result)) {
        ++stats_.failed;
        log_.add_error(*err, text, origin);
        return false;
    }
    log_.add_record(std::get<protocol::Record>(result), origin);
    std::printf("%s\n", log_.entries().back().detail.c_str());
    return true;
}

bool App::done() const {
    if (!g_running.load()) {
        return true;
    }
    return options_.count && stats_.handled >= *options_.count;
}

int App::run_udp() {
    const auto [host, port] = app::split_address(options_.addr);

    net::UdpListener listener(options_.bufsize);
    if (!listener.bind(host, port)) {
        std::fprintf(stderr, "[Tempest] Failed to bind %s: %s\n", options_.addr.c_str(),
                     std::strerror(errno));
        return 1;
    }
    std::printf("[Tempest] Listening on %s:%u (mode %s)\n", host.c_str(),
                static_cast<unsigned>(listener.local_port()), app::to_string(options_.mode));

    while (!done()) {
        auto result = listener.recv_one();
        switch (result.status) {
        case net::RecvStatus::Ok:
            handle(result.datagram.text, result.datagram.source);
            break;
        case net::RecvStatus::Truncated:
            ++stats_.truncated;
            log_.add(app::ConsoleEntryType::Error,
                     "Datagram larger than " + std::to_string(options_.bufsize) +
                         " bytes skipped (raise --bufsize)");
            break;
        case net::RecvStatus::Interrupted:
            break;
        case net::RecvStatus::Error:
            std::fprintf(stderr, "[Tempest] Receive failed: %s\n",
                         std::strerror(result.error_code));
            return 1;
        }
    }
    return 0;
}

int App::run_cloud() {
    if (!options_.token || options_.token->empty()) {
        std::fprintf(stderr, "[Tempest] --device-id needs --token or TEMPEST_TOKEN\n");
        return 2;
    }

    client_ = std::make_unique<protocol::CloudClient>(*options_.token, options_.cloud_url);
    client_->listen(*options_.device_id);
    if (options_.rapid_wind) {
        client_->listen_rapid_wind(*options_.device_id);
    }
    std::printf("[Tempest] Connecting to %s for device %llu (mode %s)\n",
                options_.cloud_url.c_str(), static_cast<unsigned long long>(*options_.device_id),
                app::to_string(options_.mode));
    client_->connect();

    data::RawEnvelope envelope;
    while (!done()) {
        if (!client_->queue().try_pop(envelope)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (envelope.origin == protocol::CloudClient::kNoticeOrigin) {
            // Connection notices are not station data and do not count.
            auto notice = protocol::decode_envelope(envelope.text);
            if (const auto *record = std::get_if<protocol::Record>(&notice)) {
                log_.add_record(*record);
            }
            continue;
        }
        handle(envelope.text, envelope.origin);
    }

    client_->stop(*options_.device_id);
    client_->disconnect();
    if (client_->queue().dropped() > 0) {
        std::fprintf(stderr, "[Tempest] %llu cloud frames dropped (queue full)\n",
                     static_cast<unsigned long long>(client_->queue().dropped()));
    }
    return 0;
}

void App::print_stats() const {
    std::printf("[Tempest] %llu envelopes, %llu failed, %llu truncated\n",
                static_cast<unsigned long long>(stats_.handled),
                static_cast<unsigned long long>(stats_.failed),
                static_cast<unsigned long long>(stats_.truncated));
}

} // namespace tempest
