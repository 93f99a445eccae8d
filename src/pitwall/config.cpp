#include "pitwall/config.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <string_view>

namespace pitwall {

namespace {

[[noreturn]] void out_of_range(const std::string &name, int64_t value, int64_t lo, int64_t hi) {
    throw std::runtime_error(name + " = " + std::to_string(value) + " is out of range [" +
                             std::to_string(lo) + ", " + std::to_string(hi) + "]");
}

int64_t checked(const std::string &name, int64_t value, int64_t lo, int64_t hi) {
    if (value < lo || value > hi) {
        out_of_range(name, value, lo, hi);
    }
    return value;
}

const nlohmann::json *find_section(const nlohmann::json &doc, const char *name) {
    if (!doc.contains(name)) {
        return nullptr;
    }
    const auto &sec = doc.at(name);
    if (!sec.is_object()) {
        throw std::runtime_error(std::string("Config section '") + name + "' must be an object");
    }
    return &sec;
}

std::optional<int64_t> integer_field(const nlohmann::json &obj, const std::string &path,
                                     const char *key) {
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    const auto &v = obj.at(key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(path + "." + key + " must be an integer");
    }
    return v.get<int64_t>();
}

std::optional<std::string> string_field(const nlohmann::json &obj, const std::string &path,
                                        const char *key) {
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    const auto &v = obj.at(key);
    if (!v.is_string()) {
        throw std::runtime_error(path + "." + key + " must be a string");
    }
    return v.get<std::string>();
}

std::optional<bool> bool_field(const nlohmann::json &obj, const std::string &path,
                               const char *key) {
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    const auto &v = obj.at(key);
    if (!v.is_boolean()) {
        throw std::runtime_error(path + "." + key + " must be a boolean");
    }
    return v.get<bool>();
}

constexpr int64_t kMaxCarIndex = static_cast<int64_t>(protocol::kMaxCars) - 1;
constexpr int64_t kMaxInt = std::numeric_limits<int64_t>::max();

int64_t parse_int(std::string_view flag, const std::string &text, int64_t lo, int64_t hi) {
    int64_t value = 0;
    const auto *end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        throw std::runtime_error(std::string(flag) + " expects an integer, got '" + text + "'");
    }
    return checked(std::string(flag), value, lo, hi);
}

} // namespace

Config parse_config(const nlohmann::json &doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config root must be an object");
    }

    Config config;

    if (const auto *listen = find_section(doc, "listen")) {
        if (auto v = string_field(*listen, "listen", "address")) {
            config.bind_address = *v;
        }
        if (auto v = integer_field(*listen, "listen", "port")) {
            config.port = static_cast<uint16_t>(checked("listen.port", *v, 0, 65535));
        }
        if (auto v = integer_field(*listen, "listen", "receive_timeout_ms")) {
            config.receive_timeout =
                std::chrono::milliseconds(checked("listen.receive_timeout_ms", *v, 1, 3600000));
        }
        if (auto v = integer_field(*listen, "listen", "max_datagram_bytes")) {
            config.max_datagram_bytes = static_cast<size_t>(
                checked("listen.max_datagram_bytes", *v, protocol::kHeaderSize, 65535));
        }
        if (auto v = bool_field(*listen, "listen", "exit_on_idle")) {
            config.exit_on_idle = *v;
        }
    }

    if (const auto *decoder = find_section(doc, "decoder")) {
        if (decoder->contains("car_index") && !decoder->at("car_index").is_null()) {
            const auto v = integer_field(*decoder, "decoder", "car_index");
            config.car_index =
                static_cast<uint8_t>(checked("decoder.car_index", *v, 0, kMaxCarIndex));
        }
        if (auto v = integer_field(*decoder, "decoder", "expected_format")) {
            config.expected_format =
                static_cast<uint16_t>(checked("decoder.expected_format", *v, 0, 65535));
        }
    }

    if (const auto *aggregator = find_section(doc, "aggregator")) {
        if (auto v = integer_field(*aggregator, "aggregator", "retention_frames")) {
            config.retention_frames =
                static_cast<size_t>(checked("aggregator.retention_frames", *v, 0, 100000));
        }
    }

    if (const auto *input = find_section(doc, "input")) {
        if (auto v = string_field(*input, "input", "replay_path")) {
            config.replay_path = *v;
        }
    }

    if (const auto *output = find_section(doc, "output")) {
        if (auto v = string_field(*output, "output", "jsonl_path")) {
            config.output_path = *v;
        }
        if (auto v = string_field(*output, "output", "capture_path")) {
            config.capture_path = *v;
        }
        if (auto v = integer_field(*output, "output", "websocket_port")) {
            config.websocket_port =
                static_cast<int>(checked("output.websocket_port", *v, 0, 65535));
        }
    }

    if (doc.contains("progress_interval")) {
        const auto &v = doc.at("progress_interval");
        if (!v.is_number_integer()) {
            throw std::runtime_error("progress_interval must be an integer");
        }
        config.progress_interval =
            static_cast<uint64_t>(checked("progress_interval", v.get<int64_t>(), 0, kMaxInt));
    }

    validate_config(config);
    return config;
}

Config load_config(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file '" + path + "'");
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw std::runtime_error("Config file '" + path + "' is not valid JSON");
    }
    return parse_config(doc);
}

void validate_config(const Config &config) {
    if (config.car_index && *config.car_index >= protocol::kMaxCars) {
        out_of_range("car_index", *config.car_index, 0, kMaxCarIndex);
    }
    if (config.receive_timeout.count() < 1) {
        throw std::runtime_error("receive_timeout must be at least 1 ms");
    }
    if (config.max_datagram_bytes < protocol::kHeaderSize) {
        throw std::runtime_error("max_datagram_bytes must hold at least one header (" +
                                 std::to_string(protocol::kHeaderSize) + " bytes)");
    }
    if (!config.replay_path.empty() && config.replay_path == config.capture_path) {
        throw std::runtime_error("Replay and capture paths must differ");
    }
}

CommandLine parse_command_line(int argc, char *argv[]) {
    CommandLine cli;

    // The config file is the base layer; apply it before any override.
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view(argv[i]) == "--config") {
            cli.config = load_config(argv[i + 1]);
        }
    }

    Config &c = cli.config;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error(std::string(arg) + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cli.show_help = true;
        } else if (arg == "--config") {
            next();
        } else if (arg == "--bind") {
            c.bind_address = next();
        } else if (arg == "--port") {
            c.port = static_cast<uint16_t>(parse_int(arg, next(), 0, 65535));
        } else if (arg == "--timeout-ms") {
            c.receive_timeout = std::chrono::milliseconds(parse_int(arg, next(), 1, 3600000));
        } else if (arg == "--exit-on-idle") {
            c.exit_on_idle = true;
        } else if (arg == "--car-index") {
            c.car_index = static_cast<uint8_t>(parse_int(arg, next(), 0, kMaxCarIndex));
        } else if (arg == "--format") {
            c.expected_format = static_cast<uint16_t>(parse_int(arg, next(), 0, 65535));
        } else if (arg == "--any-format") {
            c.expected_format = 0;
        } else if (arg == "--retention") {
            c.retention_frames = static_cast<size_t>(parse_int(arg, next(), 0, 100000));
        } else if (arg == "--replay") {
            c.replay_path = next();
        } else if (arg == "--capture") {
            c.capture_path = next();
        } else if (arg == "--output") {
            c.output_path = next();
        } else if (arg == "--ws-port") {
            c.websocket_port = static_cast<int>(parse_int(arg, next(), 0, 65535));
        } else if (arg == "--progress") {
            c.progress_interval = static_cast<uint64_t>(parse_int(arg, next(), 0, kMaxInt));
        } else if (arg == "--inspect") {
            c.inspect_count = static_cast<size_t>(parse_int(arg, next(), 1, 100000));
        } else {
            throw std::runtime_error("Unknown option '" + std::string(arg) + "'");
        }
    }

    validate_config(c);
    return cli;
}

const char *usage() {
    return "Usage: pitwall [options]\n"
           "  --config FILE      JSON configuration (flags below override it)\n"
           "  --bind ADDR        local address to bind (default 0.0.0.0)\n"
           "  --port N           UDP port (default 20777)\n"
           "  --timeout-ms N     receive timeout in milliseconds (default 1000)\n"
           "  --exit-on-idle     stop after one receive timeout with no data\n"
           "  --car-index N      decode this car slot instead of the player's\n"
           "  --format N         expected packet format (default 2025)\n"
           "  --any-format       accept every packet format\n"
           "  --retention N      frames to wait for a missing record (default 8)\n"
           "  --replay FILE      read datagrams from a capture file\n"
           "  --capture FILE     record raw datagrams to a capture file\n"
           "  --output FILE      write frames as JSON lines\n"
           "  --ws-port N        broadcast frames over WebSocket on port N\n"
           "  --progress N       progress line every N datagrams (0 = off)\n"
           "  --inspect N        hex-dump N lap/telemetry datagrams and exit\n"
           "  -h, --help         show this help\n";
}

} // namespace pitwall
