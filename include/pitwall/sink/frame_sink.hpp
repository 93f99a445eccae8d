#pragma once

#include "pitwall/data/frame.hpp"

#include <vector>

namespace pitwall::sink {

/// Receives drained frames in ascending frame id order (per session).
class FrameSink {
  public:
    virtual ~FrameSink() = default;

    virtual void consume(data::Frame &&frame) = 0;

    /// Called once when ingestion ends, and whenever buffered output
    /// should reach its destination.
    virtual void flush() {}
};

/// Hands each frame to several sinks. Does not own them.
class FanoutSink : public FrameSink {
  public:
    void add(FrameSink &sink) { sinks_.push_back(&sink); }
    [[nodiscard]] size_t size() const { return sinks_.size(); }

    void consume(data::Frame &&frame) override {
        if (sinks_.empty()) {
            return;
        }
        // Every sink but the last gets a copy.
        for (size_t i = 0; i + 1 < sinks_.size(); ++i) {
            data::Frame copy = frame;
            sinks_[i]->consume(std::move(copy));
        }
        sinks_.back()->consume(std::move(frame));
    }

    void flush() override {
        for (auto *sink : sinks_) {
            sink->flush();
        }
    }

  private:
    std::vector<FrameSink *> sinks_;
};

} // namespace pitwall::sink
