#pragma once

#include "tempest/data/envelope_queue.hpp"

#include <ixwebsocket/IXWebSocket.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace tempest::protocol {

enum class ConnectionState { Disconnected, Connecting, Connected, Error };

/// WebSocket client for the WeatherFlow real-time cloud API.
/// Runs IXWebSocket on a background thread and pushes every text frame to a
/// lock-free queue; the listener loop pops and decodes them. Frames carry the
/// same envelopes the hub broadcasts over UDP (obs_st, rapid_wind, ...), plus
/// control messages ("connection_opened", "ack") that decode as unknown.
class CloudClient {
  public:
    static constexpr const char *kDefaultUrl = "wss://ws.weatherflow.com/swd/data";

    /// Origin of frames received from the server, and of the connection
    /// notices the client synthesizes itself.
    static constexpr const char *kServerOrigin = "cloud";
    static constexpr const char *kNoticeOrigin = "client";

    explicit CloudClient(const std::string &token, const std::string &base_url = kDefaultUrl);
    ~CloudClient();

    CloudClient(const CloudClient &) = delete;
    CloudClient &operator=(const CloudClient &) = delete;

    /// Start the WebSocket connection (non-blocking).
    void connect();

    /// Close the connection.
    void disconnect();

    /// Subscribe to observations and events for a device. Remembered and
    /// re-sent after every reconnect. Repeating a subscription is a no-op.
    void listen(std::uint64_t device_id);

    /// Subscribe to the 3 second rapid wind stream for a device.
    void listen_rapid_wind(std::uint64_t device_id);

    /// Send listen_stop / listen_rapid_stop for every active subscription of
    /// a device and forget them.
    void stop(std::uint64_t device_id);

    /// Number of remembered subscriptions.
    [[nodiscard]] std::size_t subscription_count() const;

    /// Send a generic command.
    void send_command(const std::string &type, std::uint64_t device_id);

    /// Access the frame queue (polled by the listener loop).
    data::EnvelopeQueue &queue() { return queue_; }

    /// Current connection state (atomic, safe from any thread).
    [[nodiscard]] ConnectionState state() const { return state_.load(std::memory_order_relaxed); }

    /// Format a command as JSON (for testing).
    static nlohmann::json format_command(const std::string &type, std::uint64_t device_id,
                                         const std::string &request_id);

    /// Full connection URL for a token.
    static std::string make_url(const std::string &base_url, const std::string &token);

  private:
    void on_message(const ix::WebSocketMessagePtr &msg);
    void subscribe(const char *type, std::uint64_t device_id);
    void on_open(); // mark connected and resend every subscription
    void push(std::string text, const char *origin);

    std::string url_;
    ix::WebSocket ws_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<std::uint64_t> next_request_{1};
    data::EnvelopeQueue queue_{256};

    mutable std::mutex subscriptions_mutex_;
    std::vector<std::pair<std::string, std::uint64_t>> subscriptions_;
};

} // namespace tempest::protocol
