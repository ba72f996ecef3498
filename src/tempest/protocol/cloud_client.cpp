#include "tempest/protocol/cloud_client.hpp"

#include <utility>

namespace tempest::protocol {

CloudClient::CloudClient(const std::string &token, const std::string &base_url)
    : url_(make_url(base_url, token)) {
    ws_.setUrl(url_);

    // Auto-reconnect with exponential backoff: 1s initial, 30s max
    ws_.enableAutomaticReconnection();
    ws_.setMinWaitBetweenReconnectionRetries(1000);
    ws_.setMaxWaitBetweenReconnectionRetries(30000);

    ws_.setOnMessageCallback([this](const ix::WebSocketMessagePtr &msg) { on_message(msg); });
}

CloudClient::~CloudClient() { disconnect(); }

void CloudClient::connect() {
    state_.store(ConnectionState::Connecting, std::memory_order_relaxed);
    ws_.start();
}

void CloudClient::disconnect() {
    ws_.stop();
    state_.store(ConnectionState::Disconnected, std::memory_order_relaxed);
}

void CloudClient::listen(std::uint64_t device_id) { subscribe("listen_start", device_id); }

void CloudClient::listen_rapid_wind(std::uint64_t device_id) {
    subscribe("listen_rapid_start", device_id);
}

// on_open() flips the state and resends under the same lock, so a
// subscription is sent either here or there, never both.
void CloudClient::subscribe(const char *type, std::uint64_t device_id) {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    for (const auto &[existing, id] : subscriptions_) {
        if (existing == type && id == device_id) {
            return;
        }
    }
    subscriptions_.emplace_back(type, device_id);
    if (state() == ConnectionState::Connected) {
        send_command(type, device_id);
    }
}

void CloudClient::stop(std::uint64_t device_id) {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    const bool connected = state() == ConnectionState::Connected;
    auto it = subscriptions_.begin();
    while (it != subscriptions_.end()) {
        if (it->second != device_id) {
            ++it;
            continue;
        }
        if (connected) {
            send_command(it->first == "listen_rapid_start" ? "listen_rapid_stop" : "listen_stop",
                         device_id);
        }
        it = subscriptions_.erase(it);
    }
}

std::size_t CloudClient::subscription_count() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return subscriptions_.size();
}

void CloudClient::send_command(const std::string &type, std::uint64_t device_id) {
    const std::string request_id =
        "tempest-" + std::to_string(next_request_.fetch_add(1, std::memory_order_relaxed));
    auto cmd = format_command(type, device_id, request_id);
    ws_.send(cmd.dump());
}

nlohmann::json CloudClient::format_command(const std::string &type, std::uint64_t device_id,
                                           const std::string &request_id) {
    nlohmann::json cmd;
    cmd["type"] = type;
    cmd["device_id"] = device_id;
    cmd["id"] = request_id;
    return cmd;
}

std::string CloudClient::make_url(const std::string &base_url, const std::string &token) {
    const char separator = base_url.find('?') == std::string::npos ? '?' : '&';
    return base_url + separator + "token=" + token;
}

void CloudClient::on_open() {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    state_.store(ConnectionState::Connected, std::memory_order_relaxed);
    for (const auto &[type, device_id] : subscriptions_) {
        send_command(type, device_id);
    }
}

void CloudClient::push(std::string text, const char *origin) {
    queue_.try_push(data::RawEnvelope{std::move(text), origin});
}

void CloudClient::on_message(const ix::WebSocketMessagePtr &msg) {
    switch (msg->type) {
    case ix::WebSocketMessageType::Message:
        // Binary frames are not part of this API.
        if (!msg->binary) {
            push(msg->str, kServerOrigin);
        }
        break;

    case ix::WebSocketMessageType::Open:
        push(R"({"type":"connection","event":"connected"})", kNoticeOrigin);
        on_open();
        break;

    case ix::WebSocketMessageType::Close:
        state_.store(ConnectionState::Disconnected, std::memory_order_relaxed);
        push(R"({"type":"connection","event":"disconnected"})", kNoticeOrigin);
        break;

    case ix::WebSocketMessageType::Error: {
        state_.store(ConnectionState::Error, std::memory_order_relaxed);
        nlohmann::json event{{"type", "connection"}, {"event", "error"}};
        event["message"] = msg->errorInfo.reason;
        push(event.dump(), kNoticeOrigin);
        break;
    }

    default:
        break;
    }
}

} // namespace tempest::protocol
