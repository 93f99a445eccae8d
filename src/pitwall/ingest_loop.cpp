#include "pitwall/ingest_loop.hpp"
#include "pitwall/protocol/car_telemetry.hpp"
#include "pitwall/protocol/header.hpp"
#include "pitwall/protocol/lap_data.hpp"

#include <cinttypes>
#include <cstdio>
#include <utility>

namespace pitwall {

IngestOptions IngestOptions::from_config(const Config &config) {
    IngestOptions options;
    options.car_index = config.car_index;
    options.expected_format = config.expected_format;
    options.retention_frames = config.retention_frames;
    options.receive_timeout = config.receive_timeout;
    options.exit_on_idle = config.exit_on_idle;
    options.progress_interval = config.progress_interval;
    return options;
}

IngestionLoop::IngestionLoop(IngestOptions options)
    : options_(std::move(options)), aggregator_(options_.retention_frames) {}

data::IngestStats IngestionLoop::run(net::DatagramSource &source, sink::FrameSink &sink) {
    std::vector<uint8_t> buffer;
    try {
        while (!stop_requested()) {
            const auto status = source.receive(buffer, options_.receive_timeout);
            if (status == net::ReceiveStatus::Closed) {
                break;
            }
            if (status == net::ReceiveStatus::Timeout) {
                // An interrupted receive also reports Timeout.
                if (stop_requested()) {
                    break;
                }
                ++stats_.receive_timeouts;
                if (options_.exit_on_idle) {
                    std::printf("[Pitwall] No data for %lld ms, stopping\n",
                                static_cast<long long>(options_.receive_timeout.count()));
                    break;
                }
                continue;
            }

            if (capture_ != nullptr) {
                capture_->write(buffer);
            }
            process_datagram(buffer, sink);

            if (options_.progress_interval > 0 &&
                stats_.datagrams % options_.progress_interval == 0) {
                std::printf("[Pitwall] %" PRIu64 " datagrams, %" PRIu64 " frames\n",
                            stats_.datagrams, stats_.frames());
            }
        }
    } catch (const net::TransportError &) {
        // Keep what was already aggregated, then let the caller see the failure.
        stats_.truncated_datagrams = source.truncated_datagrams();
        stats_.replay_truncated = source.truncated_tail();
        finish(sink);
        throw;
    }

    stats_.truncated_datagrams = source.truncated_datagrams();
    stats_.replay_truncated = source.truncated_tail();
    finish(sink);
    return stats_;
}

void IngestionLoop::process_datagram(std::span<const uint8_t> bytes, sink::FrameSink &sink) {
    ++stats_.datagrams;

    const auto header = protocol::decode_header(bytes);
    if (!header) {
        ++stats_.header_too_short;
        return;
    }
    const auto &hdr = *header;
    ++stats_.per_packet_id[hdr.packet_id];

    if (options_.expected_format != 0 && hdr.protocol_format != options_.expected_format) {
        ++stats_.format_mismatch;
        if (!warned_format_) {
            warned_format_ = true;
            std::fprintf(stderr, "[Pitwall] Ignoring packet format %u (expecting %u)\n",
                         static_cast<unsigned>(hdr.protocol_format),
                         static_cast<unsigned>(options_.expected_format));
        }
        return;
    }

    if (!hdr.packet_kind) {
        ++stats_.unknown_kind;
        return;
    }

    if (session_id_ && *session_id_ != hdr.session_id) {
        ++stats_.session_changes;
        std::printf("[Pitwall] Session changed (%016" PRIx64 " -> %016" PRIx64 ")\n", *session_id_,
                    hdr.session_id);
        emit(aggregator_.flush_all(), sink);
        newest_overall_frame_.reset();
    }
    session_id_ = hdr.session_id;
    track_frame_ids(hdr, sink);

    if (!protocol::is_decoded_kind(*hdr.packet_kind)) {
        return;
    }

    const size_t car = options_.car_index ? *options_.car_index : hdr.controlling_car_index;
    std::optional<data::FrameRecord> record;
    protocol::DecodeError error = protocol::DecodeError::None;

    if (*hdr.packet_kind == protocol::PacketKind::LapData) {
        auto lap = protocol::decode_lap_progress(bytes, car);
        if (lap) {
            record = std::move(lap).value();
        } else {
            error = lap.error();
        }
    } else {
        auto tel = protocol::decode_car_telemetry(bytes, car);
        if (tel) {
            record = std::move(tel).value();
        } else {
            error = tel.error();
        }
    }

    if (!record) {
        count_decode_error(error, car);
        return;
    }

    const bool is_lap = std::holds_alternative<protocol::LapProgressRecord>(*record);
    const auto outcome = aggregator_.ingest(hdr.frame_id, hdr.session_time, std::move(*record));
    if (outcome == data::IngestOutcome::Late) {
        ++stats_.late_records;
        return;
    }
    if (outcome == data::IngestOutcome::Replaced) {
        ++stats_.replaced_records;
    }
    if (is_lap) {
        ++stats_.lap_records;
    } else {
        ++stats_.telemetry_records;
    }

    emit(aggregator_.drain_ready(), sink);
}

void IngestionLoop::track_frame_ids(const protocol::DatagramHeader &hdr,
                                    sink::FrameSink &sink) {
    const auto drained = aggregator_.last_drained();
    // A reordered datagram carries an older overall frame too; only a
    // rewind moves frame_id back while overall_frame_id keeps counting.
    if (drained && hdr.frame_id <= *drained && newest_overall_frame_ &&
        hdr.overall_frame_id > *newest_overall_frame_) {
        ++stats_.rewinds;
        std::printf("[Pitwall] Frame id rewound %" PRIu32 " -> %" PRIu32 " (flashback)\n",
                    *drained, hdr.frame_id);
        emit(aggregator_.flush_all(), sink);
    }
    if (!newest_overall_frame_ || hdr.overall_frame_id > *newest_overall_frame_) {
        newest_overall_frame_ = hdr.overall_frame_id;
    }
}

void IngestionLoop::finish(sink::FrameSink &sink) {
    emit(aggregator_.flush_all(), sink);
    sink.flush();
}

void IngestionLoop::emit(std::vector<data::Frame> &&frames, sink::FrameSink &sink) {
    for (auto &frame : frames) {
        if (frame.status == data::FrameStatus::Complete) {
            ++stats_.frames_complete;
        } else {
            ++stats_.frames_expired;
        }
        sink.consume(std::move(frame));
    }
}

void IngestionLoop::count_decode_error(protocol::DecodeError error, size_t car_index) {
    switch (error) {
    case protocol::DecodeError::TooShort:
        ++stats_.record_too_short;
        break;
    case protocol::DecodeError::InvalidCarIndex:
        ++stats_.invalid_car_index;
        if (!warned_car_index_) {
            warned_car_index_ = true;
            std::fprintf(stderr,
                         "[Pitwall] Car index %zu is outside 0..%zu (spectating?); "
                         "its records are dropped\n",
                         car_index, protocol::kMaxCars - 1);
        }
        break;
    case protocol::DecodeError::FieldOutOfRange:
        ++stats_.field_out_of_range;
        break;
    case protocol::DecodeError::None:
        break;
    }
}

} // namespace pitwall
