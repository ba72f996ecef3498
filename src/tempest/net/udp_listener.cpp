#include "tempest/net/udp_listener.hpp"

#include <cerrno>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tempest::net {

UdpListener::UdpListener(std::size_t buffer_bytes)
    : buffer_(buffer_bytes == 0 ? 1 : buffer_bytes) {}

UdpListener::~UdpListener() { close(); }

bool UdpListener::bind(const std::string &host, std::uint16_t port) {
    close();

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        errno = EINVAL;
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        return false;
    }

    // Several listeners on one machine may watch the same hub.
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &opt, sizeof(opt)) < 0) {
        const int saved = errno;
        ::close(fd);
        errno = saved;
        return false;
    }

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        const int saved = errno;
        ::close(fd);
        errno = saved;
        return false;
    }

    fd_ = fd;
    return true;
}

RecvResult UdpListener::recv_one() {
    RecvResult result{};

    sockaddr_in src_addr{};
    socklen_t addr_len = sizeof(src_addr);

    // MSG_TRUNC (Linux): returns the real datagram size even if truncated.
    const ssize_t n = ::recvfrom(fd_, buffer_.data(), buffer_.size(), MSG_TRUNC,
                                 reinterpret_cast<sockaddr *>(&src_addr), &addr_len);

    if (n < 0) {
        if (errno == EINTR) {
            result.status = RecvStatus::Interrupted;
        } else {
            result.status = RecvStatus::Error;
            result.error_code = errno;
            ++metrics_.errors;
        }
        return result;
    }

    if (static_cast<std::size_t>(n) > buffer_.size()) {
        result.status = RecvStatus::Truncated;
        ++metrics_.truncated;
        return result;
    }

    char ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &src_addr.sin_addr, ip, sizeof(ip));

    result.status = RecvStatus::Ok;
    result.datagram.text.assign(buffer_.data(), static_cast<std::size_t>(n));
    result.datagram.source = std::string(ip) + ":" + std::to_string(ntohs(src_addr.sin_port));

    ++metrics_.received;
    return result;
}

void UdpListener::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::uint16_t UdpListener::local_port() const {
    if (fd_ < 0) {
        return 0;
    }
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

} // namespace tempest::net
