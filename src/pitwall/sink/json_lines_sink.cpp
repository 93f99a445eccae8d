#include "pitwall/sink/json_lines_sink.hpp"
#include "pitwall/sink/frame_json.hpp"

#include <stdexcept>

namespace pitwall::sink {

JsonLinesSink::JsonLinesSink(const std::string &path) : file_(path, std::ios::trunc) {
    if (!file_) {
        throw std::runtime_error("Cannot open output file '" + path + "'");
    }
    out_ = &file_;
}

JsonLinesSink::JsonLinesSink(std::ostream &out) : out_(&out) {}

void JsonLinesSink::consume(data::Frame &&frame) {
    *out_ << frame_to_json(frame).dump() << '\n';
    ++written_;
}

void JsonLinesSink::flush() { out_->flush(); }

} // namespace pitwall::sink
