#include "pitwall/app.hpp"
#include "pitwall/inspect.hpp"
#include "pitwall/net/capture_file.hpp"
#include "pitwall/net/udp_receiver.hpp"
#include "pitwall/sink/json_lines_sink.hpp"
#include "pitwall/sink/websocket_sink.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <exception>

namespace pitwall {

namespace {

std::atomic<bool> g_interrupted{false};
std::atomic<IngestionLoop *> g_active_loop{nullptr};

void on_signal(int /*signum*/) {
    g_interrupted.store(true);
    if (auto *loop = g_active_loop.load()) {
        loop->request_stop();
    }
}

void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = on_signal;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: a blocked recv() returns EINTR so the loop sees the
    // stop request without waiting for the receive timeout.
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

} // namespace

App::App() = default;
App::~App() { g_active_loop.store(nullptr); }

int App::run(int argc, char *argv[]) {
    CommandLine cli;
    try {
        cli = parse_command_line(argc, argv);
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[Pitwall] %s\n\n%s", e.what(), usage());
        return 2;
    }
    if (cli.show_help) {
        std::printf("%s", usage());
        return 0;
    }
    const Config &config = cli.config;

    try {
        auto source = open_source(config);
        std::printf("[Pitwall] Reading from %s\n", source->describe().c_str());
        install_signal_handlers();

        if (config.inspect_count > 0) {
            return run_inspector(*source, config);
        }

        std::unique_ptr<net::CaptureWriter> capture;
        if (!config.capture_path.empty()) {
            capture = std::make_unique<net::CaptureWriter>(config.capture_path);
            std::printf("[Pitwall] Capturing raw datagrams to %s\n", config.capture_path.c_str());
        }

        sink::FanoutSink sinks;
        std::unique_ptr<sink::JsonLinesSink> jsonl;
        if (!config.output_path.empty()) {
            jsonl = std::make_unique<sink::JsonLinesSink>(config.output_path);
            sinks.add(*jsonl);
            std::printf("[Pitwall] Writing frames to %s\n", config.output_path.c_str());
        }
        std::unique_ptr<sink::WebSocketSink> websocket;
        if (config.websocket_port > 0) {
            websocket = std::make_unique<sink::WebSocketSink>(config.websocket_port);
            websocket->start();
            sinks.add(*websocket);
        }
        if (sinks.size() == 0) {
            std::printf("[Pitwall] No output configured, frames are only counted\n");
        }

        if (config.car_index) {
            std::printf("[Pitwall] Decoding car slot %u\n",
                        static_cast<unsigned>(*config.car_index));
        }

        loop_ = std::make_unique<IngestionLoop>(IngestOptions::from_config(config));
        loop_->set_capture(capture.get());
        g_active_loop.store(loop_.get());
        if (g_interrupted.load()) {
            loop_->request_stop();
        }

        const auto stats = loop_->run(*source, sinks);
        g_active_loop.store(nullptr);

        if (capture) {
            capture->flush();
            std::printf("[Pitwall] Captured %llu datagrams\n",
                        static_cast<unsigned long long>(capture->written()));
        }
        if (websocket) {
            std::printf("[Pitwall] Broadcast %llu frames, %zu dashboards connected at exit\n",
                        static_cast<unsigned long long>(websocket->broadcast_count()),
                        websocket->client_count());
            websocket->stop();
        }

        std::printf("\n%s", data::format_summary(stats).c_str());
        return 0;
    } catch (const std::exception &e) {
        g_active_loop.store(nullptr);
        std::fprintf(stderr, "[Pitwall] Fatal: %s\n", e.what());
        if (loop_) {
            std::printf("\n%s", data::format_summary(loop_->stats()).c_str());
        }
        return 1;
    }
}

std::unique_ptr<net::DatagramSource> App::open_source(const Config &config) {
    if (!config.replay_path.empty()) {
        return std::make_unique<net::CaptureReplaySource>(config.replay_path);
    }
    return std::make_unique<net::UdpReceiver>(config.bind_address, config.port,
                                              config.max_datagram_bytes);
}

int App::run_inspector(net::DatagramSource &source, const Config &config) {
    std::printf("[Pitwall] Inspecting %zu lap/telemetry datagrams\n", config.inspect_count);

    std::vector<uint8_t> buffer;
    size_t shown = 0;
    while (shown < config.inspect_count && !g_interrupted.load()) {
        const auto status = source.receive(buffer, config.receive_timeout);
        if (status == net::ReceiveStatus::Closed) {
            break;
        }
        if (status == net::ReceiveStatus::Timeout) {
            if (config.exit_on_idle) {
                break;
            }
            continue;
        }

        const auto kind = protocol::classify(buffer);
        if (!kind || !protocol::is_decoded_kind(*kind)) {
            continue;
        }
        ++shown;
        std::printf("\n[Pitwall] Datagram %zu/%zu\n%s", shown, config.inspect_count,
                    inspect_datagram(buffer, config.car_index).c_str());
    }
    return 0;
}

} // namespace pitwall
