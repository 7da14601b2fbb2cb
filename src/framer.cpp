#include "mcphost/framer.hpp"
#include "mcphost/codec.hpp"
#include "mcphost/log.hpp"

namespace mcphost {

LineFramer::LineFramer(size_t max_frame_size) : max_frame_size_(max_frame_size) {}

std::vector<std::string> LineFramer::feed(std::string_view bytes) {
    std::vector<std::string> frames;

    while (!bytes.empty()) {
        size_t nl = bytes.find('\n');
        std::string_view chunk = bytes.substr(0, nl);

        if (discarding_) {
            if (nl == std::string_view::npos) return frames;
            discarding_ = false;
            bytes.remove_prefix(nl + 1);
            continue;
        }

        if (buffer_.size() + chunk.size() > max_frame_size_) {
            MCPHOST_LOG_WARN("Dropping frame larger than ", max_frame_size_, " bytes");
            ++dropped_;
            buffer_.clear();
            discarding_ = nl == std::string_view::npos;
            if (discarding_) return frames;
            bytes.remove_prefix(nl + 1);
            continue;
        }

        buffer_.append(chunk.data(), chunk.size());
        if (nl == std::string_view::npos) return frames;
        bytes.remove_prefix(nl + 1);

        if (!buffer_.empty() && buffer_.back() == '\r') buffer_.pop_back();
        if (!buffer_.empty()) frames.push_back(std::move(buffer_));
        buffer_.clear();
    }
    return frames;
}

void LineFramer::reset() {
    buffer_.clear();
    discarding_ = false;
}

std::string LineFramer::encode(const JsonRpcMessage& msg) {
    std::string out = Codec::serialize(msg);
    out += '\n';
    return out;
}

} // namespace mcphost
