#include "pitwall/data/frame_aggregator.hpp"

#include <type_traits>
#include <utility>

namespace pitwall::data {

IngestOutcome FrameAggregator::ingest(uint32_t frame_id, float session_time, FrameRecord record) {
    if (last_drained_.has_value() && frame_id <= *last_drained_) {
        return IngestOutcome::Late;
    }

    bool created = false;
    auto it = pending_.find(frame_id);
    if (it == pending_.end()) {
        Entry entry;
        entry.frame.frame_id = frame_id;
        entry.frame.session_time = session_time;
        entry.seen_index = distinct_seen_++;
        it = pending_.emplace(frame_id, std::move(entry)).first;
        created = true;
    }

    Frame &frame = it->second.frame;
    const bool replaced = std::visit(
        [&frame](auto &&rec) {
            using T = std::decay_t<decltype(rec)>;
            bool had = false;
            if constexpr (std::is_same_v<T, protocol::LapProgressRecord>) {
                had = frame.lap_progress.has_value();
                frame.lap_progress = std::forward<decltype(rec)>(rec);
            } else {
                had = frame.car_telemetry.has_value();
                frame.car_telemetry = std::forward<decltype(rec)>(rec);
            }
            return had;
        },
        std::move(record));

    if (created) {
        return IngestOutcome::Created;
    }
    return replaced ? IngestOutcome::Replaced : IngestOutcome::Merged;
}

std::vector<Frame> FrameAggregator::drain_ready() {
    std::vector<Frame> ready;
    auto it = pending_.begin();
    while (it != pending_.end()) {
        Entry &entry = it->second;
        if (entry.frame.is_complete()) {
            entry.frame.status = FrameStatus::Complete;
        } else if (is_expired(entry)) {
            entry.frame.status = FrameStatus::Expired;
        } else {
            break; // hold newer frames until this one resolves
        }
        last_drained_ = it->first;
        ready.push_back(std::move(entry.frame));
        it = pending_.erase(it);
    }
    return ready;
}

std::vector<Frame> FrameAggregator::flush_all() {
    std::vector<Frame> out;
    out.reserve(pending_.size());
    for (auto &[id, entry] : pending_) {
        entry.frame.status =
            entry.frame.is_complete() ? FrameStatus::Complete : FrameStatus::Expired;
        out.push_back(std::move(entry.frame));
    }
    pending_.clear();
    last_drained_.reset();
    return out;
}

bool FrameAggregator::is_expired(const Entry &entry) const {
    const uint64_t newer_frames = distinct_seen_ - entry.seen_index - 1;
    return newer_frames > retention_frames_;
}

} // namespace pitwall::data
