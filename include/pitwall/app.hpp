#pragma once

#include "pitwall/config.hpp"
#include "pitwall/ingest_loop.hpp"
#include "pitwall/net/datagram_source.hpp"

#include <memory>

namespace pitwall {

/// Application entry point and lifecycle management.
/// Parses the command line, opens the datagram source and sinks, and runs
/// the ingestion loop until interrupted.
class App {
  public:
    App();
    ~App();

    /// Run the listener.
    /// Returns exit code (0 = success, 1 = runtime failure, 2 = bad usage).
    int run(int argc, char *argv[]);

  private:
    /// Socket, or capture file when a replay path is configured.
    static std::unique_ptr<net::DatagramSource> open_source(const Config &config);

    /// Dump the first inspect_count lap/telemetry datagrams and return.
    static int run_inspector(net::DatagramSource &source, const Config &config);

    std::unique_ptr<IngestionLoop> loop_;
};

} // namespace pitwall
