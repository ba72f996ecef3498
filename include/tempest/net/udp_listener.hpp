#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tempest::net {

/// UDP port the hub broadcasts on.
inline constexpr std::uint16_t kHubBroadcastPort = 50222;

enum class RecvStatus : std::uint8_t {
    Ok,          // datagram received
    Truncated,   // datagram larger than the receive buffer (MSG_TRUNC)
    Interrupted, // recv interrupted by a signal
    Error,       // system error, see error_code
};

struct Datagram {
    std::string text;
    std::string source; // "a.b.c.d:port"
};

struct RecvResult {
    RecvStatus status = RecvStatus::Error;
    Datagram datagram;  // valid only if status == Ok
    int error_code = 0; // errno if status == Error
};

struct RecvMetrics {
    std::uint64_t received = 0;
    std::uint64_t truncated = 0;
    std::uint64_t errors = 0;
};

/// Blocking receiver for hub broadcast datagrams.
///
/// Owns its socket: closed on destruction.
/// Thread safety: NOT thread-safe. One listener per thread.
class UdpListener {
  public:
    /// `buffer_bytes` must hold an entire hub datagram; larger ones are
    /// reported as Truncated and skipped.
    explicit UdpListener(std::size_t buffer_bytes = 400);
    ~UdpListener();

    UdpListener(const UdpListener &) = delete;
    UdpListener &operator=(const UdpListener &) = delete;

    /// Create the socket and bind it to host:port. Port 0 picks an ephemeral
    /// port (see local_port()). Returns false and leaves errno set on failure.
    bool bind(const std::string &host, std::uint16_t port);

    /// Receive a single datagram. Blocks until data or a signal arrives.
    RecvResult recv_one();

    void close();

    [[nodiscard]] bool is_open() const { return fd_ >= 0; }
    [[nodiscard]] std::uint16_t local_port() const;
    [[nodiscard]] const RecvMetrics &metrics() const { return metrics_; }
    [[nodiscard]] std::size_t buffer_bytes() const { return buffer_.size(); }

  private:
    int fd_ = -1;
    std::vector<char> buffer_;
    RecvMetrics metrics_;
};

} // namespace tempest::net
