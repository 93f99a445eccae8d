#include "fixtures/packet_builder.hpp"
#include "pitwall/sink/websocket_sink.hpp"

#include <gtest/gtest.h>

using namespace pitwall::data;
using namespace pitwall::sink;
using namespace pitwall::fixtures;

TEST(WebSocketSink, MessageWrapsFrame) {
    Frame frame;
    frame.frame_id = 55;
    frame.session_time = 3.0f;
    frame.lap_progress = lap_record(1000);
    frame.car_telemetry = telemetry_record(210);
    frame.status = FrameStatus::Complete;

    auto msg = WebSocketSink::format_message(frame);
    EXPECT_EQ(msg["type"], "frame");
    EXPECT_EQ(msg["frame"]["frame_id"], 55);
    EXPECT_EQ(msg["frame"]["status"], "complete");
    EXPECT_EQ(msg["frame"]["car_telemetry"]["speed_kph"], 210);
}

TEST(WebSocketSink, MessageRoundTripsThroughText) {
    Frame frame;
    frame.frame_id = 8;
    frame.lap_progress = lap_record(2000);

    const std::string text = WebSocketSink::format_message(frame).dump();
    auto parsed = nlohmann::json::parse(text);
    EXPECT_EQ(parsed["type"], "frame");
    EXPECT_EQ(parsed["frame"]["lap_progress"]["current_lap_time_ms"], 2000);
    EXPECT_TRUE(parsed["frame"]["car_telemetry"].is_null());
}

TEST(WebSocketSink, ConsumeBeforeStartIsIgnored) {
    WebSocketSink sink(0, "127.0.0.1");
    Frame frame;
    frame.frame_id = 1;
    sink.consume(std::move(frame));
    EXPECT_EQ(sink.broadcast_count(), 0u);
}
