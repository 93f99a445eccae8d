#pragma once

#include "pitwall/protocol/header.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace pitwall {

/// Listener configuration. Defaults match the game's out-of-the-box UDP
/// settings; a JSON file and then command-line flags override them.
struct Config {
    // listen
    std::string bind_address = "0.0.0.0";
    uint16_t port = protocol::kDefaultPort;
    std::chrono::milliseconds receive_timeout{1000};
    size_t max_datagram_bytes = 2048;
    bool exit_on_idle = false;

    // decoder
    std::optional<uint8_t> car_index;                     // unset: header's controlling car
    uint16_t expected_format = protocol::kProtocolFormat; // 0 accepts any format

    // aggregator
    size_t retention_frames = 8;

    // input / output
    std::string replay_path;  // read a capture file instead of the socket
    std::string capture_path; // record raw datagrams
    std::string output_path;  // JSON-lines frames
    int websocket_port = 0;   // 0 disables the broadcast server

    uint64_t progress_interval = 500; // datagrams between progress lines, 0 = quiet
    size_t inspect_count = 0;         // >0: dump this many datagrams and exit
};

/// Parse a configuration document. Missing sections and keys keep their
/// defaults. Expects:
/// {"listen": {"address", "port", "receive_timeout_ms", "max_datagram_bytes", "exit_on_idle"},
///  "decoder": {"car_index", "expected_format"},
///  "aggregator": {"retention_frames"},
///  "input": {"replay_path"},
///  "output": {"jsonl_path", "capture_path", "websocket_port"},
///  "progress_interval": N}
/// Throws std::runtime_error on wrong types or out-of-range values.
Config parse_config(const nlohmann::json &doc);

/// Read and parse a JSON configuration file.
Config load_config(const std::string &path);

/// Range checks shared by the file and command-line paths.
/// An out-of-range car index fails here, once, at startup.
void validate_config(const Config &config);

struct CommandLine {
    Config config;
    bool show_help = false;
};

/// Parse argv. `--config FILE` is applied first, other flags override it.
/// Throws std::runtime_error on unknown flags or bad values.
CommandLine parse_command_line(int argc, char *argv[]);

[[nodiscard]] const char *usage();

} // namespace pitwall
