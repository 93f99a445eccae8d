#pragma once

#include "pitwall/sink/frame_sink.hpp"

#include <cstdint>
#include <fstream>
#include <ostream>
#include <string>

namespace pitwall::sink {

/// Writes one JSON object per frame, newline separated.
class JsonLinesSink : public FrameSink {
  public:
    /// Write to a file (created or truncated). Throws std::runtime_error
    /// if the file cannot be opened.
    explicit JsonLinesSink(const std::string &path);

    /// Write to a caller-owned stream.
    explicit JsonLinesSink(std::ostream &out);

    void consume(data::Frame &&frame) override;
    void flush() override;

    [[nodiscard]] uint64_t written() const { return written_; }

  private:
    std::ofstream file_;
    std::ostream *out_ = nullptr;
    uint64_t written_ = 0;
};

} // namespace pitwall::sink
