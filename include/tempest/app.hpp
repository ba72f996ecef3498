#pragma once

#include "tempest/app/console.hpp"
#include "tempest/app/options.hpp"
#include "tempest/protocol/cloud_client.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace tempest {

/// Command-line listener: receives envelopes from the hub (UDP) or the
/// cloud API and shows them in the selected display mode.
class App {
  public:
    App();
    ~App();

    /// Run until --count envelopes were handled or SIGINT/SIGTERM.
    /// Returns exit code (0 = success, 1 = runtime failure, 2 = usage error).
    int run(int argc, char *argv[]);

    /// Handle one envelope according to the display mode.
    /// Exposed for testing; returns false if the envelope could not be shown.
    bool handle(const std::string &text, const std::string &origin);

    void set_options(const app::Options &options) { options_ = options; }
    [[nodiscard]] const app::ConsoleLog &log() const { return log_; }

    struct Stats {
        std::uint64_t handled = 0;
        std::uint64_t failed = 0;
        std::uint64_t truncated = 0;
    };
    [[nodiscard]] const Stats &stats() const { return stats_; }

  private:
    int run_udp();
    int run_cloud();
    [[nodiscard]] bool done() const;
    void print_stats() const;

    app::Options options_;
    app::ConsoleLog log_;
    std::unique_ptr<protocol::CloudClient> client_;
    Stats stats_;
};

} // namespace tempest
