#pragma once

#include "tempest/protocol/decode_error.hpp"
#include "tempest/protocol/records.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace tempest::app {

/// Types of console entries, used for the terminal prefix.
enum class ConsoleEntryType {
    Observation, // obs_air, obs_sky, obs_st, rapid_wind
    Event,       // evt_precip, evt_strike
    Status,      // device_status, hub_status
    Error,       // decode failures and transport errors
    System,      // connection events and unknown messages
};

/// A single entry in the console log.
struct ConsoleEntry {
    ConsoleEntryType type = ConsoleEntryType::System;
    std::string message;
    std::string detail; // full record as JSON, or the raw text of a failed envelope
    std::string origin;
    double wall_time = 0.0;
};

/// Rolling log of what the listener received. Each entry is mirrored to the
/// terminal as "[TAG] message" unless echo is off.
class ConsoleLog {
  public:
    static constexpr size_t kDefaultMaxEntries = 1000;

    explicit ConsoleLog(size_t max_entries = kDefaultMaxEntries, bool echo = true);

    void add(ConsoleEntryType type, const std::string &message, const std::string &detail = "",
             const std::string &origin = "");
    void add_record(const protocol::Record &record, const std::string &origin = "");
    void add_error(const protocol::DecodeError &error, const std::string &raw,
                   const std::string &origin = "");

    [[nodiscard]] const std::deque<ConsoleEntry> &entries() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    void clear();
    [[nodiscard]] double elapsed() const;

    /// One-line summary of a record, e.g. "SK-00008453 rain start at 1493322445".
    static std::string format_record(const protocol::Record &record);
    static ConsoleEntryType entry_type(const protocol::Record &record);
    static const char *entry_prefix(ConsoleEntryType type);

  private:
    static std::string format_unknown(const protocol::UnknownMessage &msg);

    size_t max_entries_ = kDefaultMaxEntries;
    bool echo_ = true;
    std::deque<ConsoleEntry> entries_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace tempest::app
