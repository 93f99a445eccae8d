#pragma once

#include "pitwall/data/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace pitwall::data {

/// Result of handing one record to the aggregator.
enum class IngestOutcome {
    Created,  // first record seen for this frame id
    Merged,   // filled the missing side of a resident frame
    Replaced, // same side arrived again; the newer record wins
    Late,     // frame id at or below the last drained frame; dropped
};

/// Correlates lap progress and telemetry records sharing a frame id.
///
/// Frames are keyed by id in an ordered map. A frame is ready once both
/// sides are present (Complete) or once more than `retention_frames`
/// distinct newer frame ids have been seen since it was created (Expired).
/// drain_ready() emits ready frames from the front of the map and stops at
/// the first frame that is neither, so the sink always receives strictly
/// ascending frame ids.
///
/// Thread safety: owned by the ingestion thread only.
class FrameAggregator {
  public:
    static constexpr size_t kDefaultRetentionFrames = 8;

    explicit FrameAggregator(size_t retention_frames = kDefaultRetentionFrames)
        : retention_frames_(retention_frames) {}

    IngestOutcome ingest(uint32_t frame_id, float session_time, FrameRecord record);

    /// Remove and return Complete or Expired frames in ascending id order.
    [[nodiscard]] std::vector<Frame> drain_ready();

    /// Remove and return every resident frame; incomplete ones as Expired.
    /// Also forgets the late-record watermark (used when a session restarts
    /// and frame ids begin again from zero).
    [[nodiscard]] std::vector<Frame> flush_all();

    [[nodiscard]] size_t pending() const { return pending_.size(); }
    [[nodiscard]] size_t retention_frames() const { return retention_frames_; }

    /// Highest frame id handed out so far, if any.
    [[nodiscard]] std::optional<uint32_t> last_drained() const { return last_drained_; }

  private:
    struct Entry {
        Frame frame;
        uint64_t seen_index = 0; // value of distinct_seen_ when created
    };

    [[nodiscard]] bool is_expired(const Entry &entry) const;

    size_t retention_frames_;
    uint64_t distinct_seen_ = 0;
    std::map<uint32_t, Entry> pending_;
    std::optional<uint32_t> last_drained_;
};

} // namespace pitwall::data
