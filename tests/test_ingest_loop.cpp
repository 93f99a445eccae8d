#include "fixtures/packet_builder.hpp"
#include "pitwall/ingest_loop.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace pitwall;
using namespace pitwall::fixtures;
using pitwall::data::FrameStatus;

namespace {

HeaderFields at_frame(uint32_t frame_id, uint8_t car = 0) {
    HeaderFields h;
    h.frame_id = frame_id;
    h.overall_frame_id = frame_id;
    h.car_index = car;
    return h;
}

IngestOptions quiet_options() {
    IngestOptions options;
    options.progress_interval = 0;
    return options;
}

} // namespace

TEST(IngestionLoop, MergesLapAndTelemetryIntoFrames) {
    ScriptedSource source;
    for (uint32_t id = 1; id <= 3; ++id) {
        source.datagram(lap_packet(at_frame(id), 1000 * id));
        source.datagram(telemetry_packet(at_frame(id), static_cast<uint16_t>(200 + id), 0.5f));
    }
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    ASSERT_EQ(sink.frames.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(sink.frames[i].frame_id, i + 1);
        EXPECT_EQ(sink.frames[i].status, FrameStatus::Complete);
        EXPECT_EQ(sink.frames[i].car_telemetry->speed_kph, 201 + i);
        EXPECT_EQ(sink.frames[i].lap_progress->current_lap_time_ms, 1000 * (i + 1));
    }
    EXPECT_EQ(stats.datagrams, 6u);
    EXPECT_EQ(stats.lap_records, 3u);
    EXPECT_EQ(stats.telemetry_records, 3u);
    EXPECT_EQ(stats.frames_complete, 3u);
    EXPECT_EQ(stats.per_packet_id[2], 3u);
    EXPECT_EQ(stats.per_packet_id[6], 3u);
    EXPECT_EQ(sink.flushes, 1);
}

TEST(IngestionLoop, MissingSideExpiresAndStaysAbsent) {
    ScriptedSource source;
    source.datagram(telemetry_packet(at_frame(1), 150, 0.2f));
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    ASSERT_EQ(sink.frames.size(), 1u);
    EXPECT_EQ(sink.frames[0].status, FrameStatus::Expired);
    EXPECT_TRUE(sink.frames[0].car_telemetry.has_value());
    EXPECT_FALSE(sink.frames[0].lap_progress.has_value());
    EXPECT_EQ(stats.frames_expired, 1u);
}

TEST(IngestionLoop, MalformedDatagramsAreCountedNotFatal) {
    HeaderFields unknown = at_frame(1);
    unknown.packet_id = 99;
    auto short_record = telemetry_packet(at_frame(1), 100, 0.5f);
    short_record.resize(40);

    ScriptedSource source;
    source.datagram(std::vector<uint8_t>(10, 0));
    source.datagram(DatagramBuilder(protocol::kHeaderSize).header(unknown).build());
    source.datagram(short_record);
    source.datagram(telemetry_packet(at_frame(2), 100, 3.0f)); // throttle out of range
    source.datagram(telemetry_packet(at_frame(3), 100, 0.5f));
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.datagrams, 5u);
    EXPECT_EQ(stats.header_too_short, 1u);
    EXPECT_EQ(stats.unknown_kind, 1u);
    EXPECT_EQ(stats.per_packet_id[99], 1u);
    EXPECT_EQ(stats.record_too_short, 1u);
    EXPECT_EQ(stats.field_out_of_range, 1u);
    EXPECT_EQ(stats.telemetry_records, 1u);
    ASSERT_EQ(sink.frames.size(), 1u);
    EXPECT_EQ(sink.frames[0].frame_id, 3u);
}

TEST(IngestionLoop, FormatMismatchDropped) {
    ScriptedSource source;
    auto h = at_frame(1);
    h.format = 2024;
    source.datagram(telemetry_packet(h, 100, 0.5f));
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.format_mismatch, 1u);
    EXPECT_TRUE(sink.frames.empty());
}

TEST(IngestionLoop, ZeroExpectedFormatAcceptsAny) {
    ScriptedSource source;
    auto h = at_frame(1);
    h.format = 2024;
    source.datagram(telemetry_packet(h, 100, 0.5f));
    CollectingSink sink;
    auto options = quiet_options();
    options.expected_format = 0;
    IngestionLoop loop(options);

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.format_mismatch, 0u);
    EXPECT_EQ(sink.frames.size(), 1u);
}

TEST(IngestionLoop, SpectatorCarIndexCounted) {
    ScriptedSource source;
    source.datagram(telemetry_packet(at_frame(1, 255), 100, 0.5f));
    source.datagram(lap_packet(at_frame(1, 255), 100));
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.invalid_car_index, 2u);
    EXPECT_TRUE(sink.frames.empty());
}

TEST(IngestionLoop, CarIndexOverrideSelectsSlot) {
    HeaderFields h = at_frame(1, 4);
    DatagramBuilder b(kTelemetryPacketSize);
    b.header(h);
    b.u16(telemetry_offset(4), 111).u16(telemetry_offset(9), 999);

    ScriptedSource source;
    source.datagram(b.build());
    CollectingSink sink;
    auto options = quiet_options();
    options.car_index = 9;
    IngestionLoop loop(options);

    (void)loop.run(source, sink);
    ASSERT_EQ(sink.frames.size(), 1u);
    EXPECT_EQ(sink.frames[0].car_telemetry->speed_kph, 999);
}

TEST(IngestionLoop, NonDecodedKindsOnlyCounted) {
    HeaderFields h = at_frame(1);
    h.packet_id = static_cast<uint8_t>(protocol::PacketKind::Motion);
    ScriptedSource source;
    source.datagram(DatagramBuilder(1349).header(h).build());
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.per_packet_id[0], 1u);
    EXPECT_EQ(stats.dropped(), 0u);
    EXPECT_TRUE(sink.frames.empty());
}

TEST(IngestionLoop, SessionChangeFlushesPendingFrames) {
    auto first = at_frame(500);
    auto second = at_frame(1);
    second.session_id = first.session_id + 1;

    ScriptedSource source;
    source.datagram(lap_packet(first, 10));
    source.datagram(lap_packet(second, 20));
    source.datagram(telemetry_packet(second, 30, 0.1f));
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.session_changes, 1u);
    ASSERT_EQ(sink.frames.size(), 2u);
    EXPECT_EQ(sink.frames[0].frame_id, 500u);
    EXPECT_EQ(sink.frames[0].status, FrameStatus::Expired);
    // Frame 1 of the new session is not treated as late.
    EXPECT_EQ(sink.frames[1].frame_id, 1u);
    EXPECT_EQ(sink.frames[1].status, FrameStatus::Complete);
    EXPECT_EQ(stats.late_records, 0u);
}

TEST(IngestionLoop, LateRecordCounted) {
    ScriptedSource source;
    source.datagram(lap_packet(at_frame(5), 1));
    source.datagram(telemetry_packet(at_frame(5), 1, 0.0f));
    source.datagram(telemetry_packet(at_frame(4), 1, 0.0f));
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.late_records, 1u);
    EXPECT_EQ(sink.frames.size(), 1u);
}

TEST(IngestionLoop, TimeoutContinuesUnlessExitOnIdle) {
    {
        ScriptedSource source;
        source.timeout().datagram(telemetry_packet(at_frame(1), 100, 0.5f));
        CollectingSink sink;
        IngestionLoop loop(quiet_options());
        auto stats = loop.run(source, sink);
        EXPECT_EQ(stats.receive_timeouts, 1u);
        EXPECT_EQ(stats.datagrams, 1u);
    }
    {
        ScriptedSource source;
        source.timeout().datagram(telemetry_packet(at_frame(1), 100, 0.5f));
        CollectingSink sink;
        auto options = quiet_options();
        options.exit_on_idle = true;
        IngestionLoop loop(options);
        auto stats = loop.run(source, sink);
        EXPECT_EQ(stats.receive_timeouts, 1u);
        EXPECT_EQ(stats.datagrams, 0u);
    }
}

TEST(IngestionLoop, StopRequestedBeforeRunReceivesNothing) {
    ScriptedSource source;
    source.datagram(telemetry_packet(at_frame(1), 100, 0.5f));
    CollectingSink sink;
    IngestionLoop loop(quiet_options());
    loop.request_stop();

    auto stats = loop.run(source, sink);
    EXPECT_EQ(source.calls, 0);
    EXPECT_EQ(stats.datagrams, 0u);
    EXPECT_EQ(sink.flushes, 1);
}

TEST(IngestionLoop, TransportErrorPropagatesAfterFlush) {
    ScriptedSource source;
    source.datagram(telemetry_packet(at_frame(1), 100, 0.5f)).fail_with("socket closed");
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    EXPECT_THROW(loop.run(source, sink), net::TransportError);
    ASSERT_EQ(sink.frames.size(), 1u);
    EXPECT_EQ(sink.frames[0].status, FrameStatus::Expired);
    EXPECT_EQ(loop.stats().datagrams, 1u);
}

TEST(IngestionLoop, CapturesRawDatagrams) {
    const auto path =
        (std::filesystem::temp_directory_path() / "pitwall_loop_capture.pwcap").string();
    const auto packet = telemetry_packet(at_frame(1), 100, 0.5f);
    {
        ScriptedSource source;
        source.datagram(std::vector<uint8_t>(5, 1)).datagram(packet);
        CollectingSink sink;
        net::CaptureWriter capture(path);
        IngestionLoop loop(quiet_options());
        loop.set_capture(&capture);
        (void)loop.run(source, sink);
        EXPECT_EQ(capture.written(), 2u);
    }

    net::CaptureReplaySource replay(path);
    CollectingSink sink;
    IngestionLoop loop(quiet_options());
    auto stats = loop.run(replay, sink);
    EXPECT_EQ(stats.datagrams, 2u);
    EXPECT_EQ(stats.header_too_short, 1u);
    ASSERT_EQ(sink.frames.size(), 1u);
    EXPECT_EQ(sink.frames[0].car_telemetry->speed_kph, 100);
    std::filesystem::remove(path);
}

TEST(IngestionLoop, OptionsFromConfig) {
    Config config;
    config.car_index = 3;
    config.expected_format = 0;
    config.retention_frames = 2;
    config.exit_on_idle = true;
    config.progress_interval = 10;

    auto options = IngestOptions::from_config(config);
    EXPECT_EQ(options.car_index, 3);
    EXPECT_EQ(options.expected_format, 0);
    EXPECT_EQ(options.retention_frames, 2u);
    EXPECT_TRUE(options.exit_on_idle);
    EXPECT_EQ(options.progress_interval, 10u);
}

TEST(IngestionLoop, FlashbackRewindRestartsAggregation) {
    ScriptedSource source;
    for (uint32_t id = 1000; id < 1100; ++id) {
        source.datagram(lap_packet(at_frame(id), id));
        source.datagram(telemetry_packet(at_frame(id), 200, 0.5f));
    }
    // Same session; frame ids jump back while the overall counter keeps going.
    for (uint32_t id = 400; id < 1000; ++id) {
        auto h = at_frame(id);
        h.overall_frame_id = id + 700;
        source.datagram(lap_packet(h, id));
        source.datagram(telemetry_packet(h, 210, 0.5f));
    }
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.rewinds, 1u);
    EXPECT_EQ(stats.session_changes, 0u);
    EXPECT_EQ(stats.late_records, 0u);
    EXPECT_EQ(stats.frames_complete, 700u);
    ASSERT_EQ(sink.frames.size(), 700u);
    EXPECT_EQ(sink.frames[99].frame_id, 1099u);
    EXPECT_EQ(sink.frames[100].frame_id, 400u);
    EXPECT_EQ(sink.frames[100].car_telemetry->speed_kph, 210);
    EXPECT_EQ(sink.frames.back().frame_id, 999u);
}

TEST(IngestionLoop, ReorderedOldDatagramIsStillLate) {
    ScriptedSource source;
    source.datagram(lap_packet(at_frame(10), 1));
    source.datagram(telemetry_packet(at_frame(10), 1, 0.0f));
    source.datagram(lap_packet(at_frame(11), 2));
    // Delayed datagram from an earlier tick: both counters are older.
    source.datagram(telemetry_packet(at_frame(9), 1, 0.0f));
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.rewinds, 0u);
    EXPECT_EQ(stats.late_records, 1u);
}

TEST(IngestionLoop, InterruptedReceiveIsNotAnIdleTimeout) {
    auto options = quiet_options();
    options.exit_on_idle = true;
    IngestionLoop loop(options);
    ScriptedSource source;
    source.datagram(telemetry_packet(at_frame(1), 100, 0.5f))
        .interrupted([&loop] { loop.request_stop(); })
        .datagram(telemetry_packet(at_frame(2), 100, 0.5f));
    CollectingSink sink;

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.receive_timeouts, 0u);
    EXPECT_EQ(stats.datagrams, 1u);
    EXPECT_EQ(source.calls, 2);
}

TEST(IngestionLoop, SourceCountersReachStats) {
    ScriptedSource source;
    source.datagram(telemetry_packet(at_frame(1), 100, 0.5f));
    source.truncated = 3;
    source.ended_on_partial_record = true;
    CollectingSink sink;
    IngestionLoop loop(quiet_options());

    auto stats = loop.run(source, sink);
    EXPECT_EQ(stats.truncated_datagrams, 3u);
    EXPECT_TRUE(stats.replay_truncated);
}

TEST(IngestionLoop, TruncatedReplayReported) {
    const auto path =
        (std::filesystem::temp_directory_path() / "pitwall_loop_truncated.pwcap").string();
    {
        net::CaptureWriter capture(path);
        capture.write(telemetry_packet(at_frame(1), 100, 0.5f));
        capture.write(telemetry_packet(at_frame(2), 100, 0.5f));
    }
    std::filesystem::resize_file(path, std::filesystem::file_size(path) - 100);

    net::CaptureReplaySource replay(path);
    CollectingSink sink;
    IngestionLoop loop(quiet_options());
    auto stats = loop.run(replay, sink);
    EXPECT_EQ(stats.datagrams, 1u);
    EXPECT_TRUE(stats.replay_truncated);
    std::filesystem::remove(path);
}
