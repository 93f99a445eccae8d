#include "pitwall/sink/websocket_sink.hpp"
#include "pitwall/sink/frame_json.hpp"

#include <ixwebsocket/IXNetSystem.h>

#include <cstdio>
#include <stdexcept>

namespace pitwall::sink {

WebSocketSink::WebSocketSink(int port, const std::string &host)
    : host_(host), port_(port), server_(port, host) {
    ix::initNetSystem();

    server_.setOnClientMessageCallback(
        [this](std::shared_ptr<ix::ConnectionState> state, ix::WebSocket & /*ws*/,
               const ix::WebSocketMessagePtr &msg) { on_client_message(state, msg); });
}

WebSocketSink::~WebSocketSink() { stop(); }

void WebSocketSink::start() {
    auto res = server_.listen();
    if (!res.first) {
        throw std::runtime_error("WebSocket listen on " + host_ + ":" + std::to_string(port_) +
                                 " failed: " + res.second);
    }
    server_.disablePerMessageDeflate();
    server_.start();
    running_.store(true, std::memory_order_relaxed);
    std::printf("[Pitwall] Broadcasting frames on ws://%s:%d\n", host_.c_str(), port_);
}

void WebSocketSink::stop() {
    if (running_.exchange(false)) {
        server_.stop();
    }
}

void WebSocketSink::consume(data::Frame &&frame) {
    if (!running_.load(std::memory_order_relaxed)) {
        return;
    }
    const std::string text = format_message(frame).dump();
    for (const auto &client : server_.getClients()) {
        client->sendText(text);
    }
    ++broadcast_;
}

size_t WebSocketSink::client_count() { return server_.getClients().size(); }

nlohmann::json WebSocketSink::format_message(const data::Frame &frame) {
    nlohmann::json msg;
    msg["type"] = "frame";
    msg["frame"] = frame_to_json(frame);
    return msg;
}

void WebSocketSink::on_client_message(const std::shared_ptr<ix::ConnectionState> &state,
                                      const ix::WebSocketMessagePtr &msg) {
    switch (msg->type) {
    case ix::WebSocketMessageType::Open:
        std::printf("[Pitwall] Dashboard connected (%s)\n", state->getId().c_str());
        break;

    case ix::WebSocketMessageType::Close:
        std::printf("[Pitwall] Dashboard disconnected (%s)\n", state->getId().c_str());
        break;

    case ix::WebSocketMessageType::Error:
        std::fprintf(stderr, "[Pitwall] Dashboard error: %s\n", msg->errorInfo.reason.c_str());
        break;

    default:
        // Broadcast only; inbound messages are ignored.
        break;
    }
}

} // namespace pitwall::sink
