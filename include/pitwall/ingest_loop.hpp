#pragma once

#include "pitwall/config.hpp"
#include "pitwall/data/frame_aggregator.hpp"
#include "pitwall/data/ingest_stats.hpp"
#include "pitwall/net/capture_file.hpp"
#include "pitwall/net/datagram_source.hpp"
#include "pitwall/protocol/decode_result.hpp"
#include "pitwall/protocol/header.hpp"
#include "pitwall/sink/frame_sink.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>

namespace pitwall {

struct IngestOptions {
    std::optional<uint8_t> car_index; // unset: each header's controlling car
    uint16_t expected_format = protocol::kProtocolFormat; // 0 accepts any
    size_t retention_frames = data::FrameAggregator::kDefaultRetentionFrames;
    std::chrono::milliseconds receive_timeout{1000};
    bool exit_on_idle = false;
    uint64_t progress_interval = 0;

    static IngestOptions from_config(const Config &config);
};

/// Receive → decode → aggregate → sink, one datagram at a time.
///
/// Everything runs on the calling thread; the only thing another thread
/// (or a signal handler) may touch is request_stop(), which is checked once
/// per iteration so a datagram is never abandoned half-decoded.
class IngestionLoop {
  public:
    explicit IngestionLoop(IngestOptions options = {});

    IngestionLoop(const IngestionLoop &) = delete;
    IngestionLoop &operator=(const IngestionLoop &) = delete;

    /// Run until stopped, the source closes, or (with exit_on_idle) a
    /// receive times out. Remaining frames are flushed to the sink before
    /// returning. net::TransportError propagates after that flush.
    data::IngestStats run(net::DatagramSource &source, sink::FrameSink &sink);

    /// Decode one datagram and push any frames it makes ready.
    /// Malformed input is counted, never thrown. A frame id at or below the
    /// last drained one while overall_frame_id still advances is a rewind
    /// (flashback) and flushes the aggregator like a session change.
    void process_datagram(std::span<const uint8_t> bytes, sink::FrameSink &sink);

    /// Flush every resident frame and the sink.
    void finish(sink::FrameSink &sink);

    /// Record each received datagram, before decoding, to a capture file.
    void set_capture(net::CaptureWriter *capture) { capture_ = capture; }

    void request_stop() { stop_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

    [[nodiscard]] const data::IngestStats &stats() const { return stats_; }

  private:
    void emit(std::vector<data::Frame> &&frames, sink::FrameSink &sink);
    void count_decode_error(protocol::DecodeError error, size_t car_index);
    void track_frame_ids(const protocol::DatagramHeader &hdr, sink::FrameSink &sink);

    IngestOptions options_;
    data::FrameAggregator aggregator_;
    data::IngestStats stats_;
    std::optional<uint64_t> session_id_;
    std::optional<uint32_t> newest_overall_frame_;
    net::CaptureWriter *capture_ = nullptr;
    bool warned_car_index_ = false;
    bool warned_format_ = false;
    std::atomic<bool> stop_{false};
};

} // namespace pitwall
