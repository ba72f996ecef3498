#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tempest::data {

/// Single-producer single-consumer lock-free ring buffer.
/// Producer: network thread (IXWebSocket callbacks).
/// Consumer: the listener loop, which decodes each envelope.
/// Pushes into a full queue are rejected and counted in dropped().
template <typename T> class SPSCQueue {
  public:
    explicit SPSCQueue(size_t capacity)
        : capacity_(capacity < 2 ? 2 : capacity), buffer_(capacity_) {}

    /// Push an item (producer only). Returns false if full.
    bool try_push(T &&item) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t next = (tail + 1) % capacity_;
        if (next == head_.load(std::memory_order_acquire)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        buffer_[tail] = std::move(item);
        tail_.store(next, std::memory_order_release);
        return true;
    }

    /// Pop an item (consumer only). Returns false if empty.
    bool try_pop(T &item) {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        item = std::move(buffer_[head]);
        head_.store((head + 1) % capacity_, std::memory_order_release);
        return true;
    }

    [[nodiscard]] bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    /// Usable capacity (one slot reserved for full/empty distinction).
    [[nodiscard]] size_t capacity() const { return capacity_ - 1; }

    /// Number of pushes rejected because the queue was full.
    [[nodiscard]] std::uint64_t dropped() const {
        return dropped_.load(std::memory_order_relaxed);
    }

  private:
    size_t capacity_;
    std::vector<T> buffer_;

    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

/// A raw envelope as handed over by a transport, before decoding.
struct RawEnvelope {
    std::string text;
    std::string origin; // "192.168.1.20:50222", "cloud", ...
};

/// Cloud client frames (network thread -> listener loop).
using EnvelopeQueue = SPSCQueue<RawEnvelope>;

} // namespace tempest::data
