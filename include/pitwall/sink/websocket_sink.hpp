#pragma once

#include "pitwall/sink/frame_sink.hpp"

#include <ixwebsocket/IXWebSocketServer.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace pitwall::sink {

/// Broadcasts each frame as a JSON text message to every connected
/// WebSocket client (live dashboards). IXWebSocket runs the server on its
/// own threads; consume() only queues sends, so the ingestion thread never
/// waits on a slow client.
class WebSocketSink : public FrameSink {
  public:
    explicit WebSocketSink(int port, const std::string &host = "0.0.0.0");
    ~WebSocketSink() override;

    WebSocketSink(const WebSocketSink &) = delete;
    WebSocketSink &operator=(const WebSocketSink &) = delete;

    /// Bind and start accepting clients. Throws std::runtime_error on failure.
    void start();
    void stop();

    void consume(data::Frame &&frame) override;

    [[nodiscard]] size_t client_count();
    [[nodiscard]] uint64_t broadcast_count() const { return broadcast_; }

    /// Wire form of one frame (for testing).
    /// {"type": "frame", "frame": {...frame_to_json...}}
    static nlohmann::json format_message(const data::Frame &frame);

  private:
    void on_client_message(const std::shared_ptr<ix::ConnectionState> &state,
                           const ix::WebSocketMessagePtr &msg);

    std::string host_;
    int port_;
    ix::WebSocketServer server_;
    std::atomic<bool> running_{false};
    uint64_t broadcast_ = 0;
};

} // namespace pitwall::sink
