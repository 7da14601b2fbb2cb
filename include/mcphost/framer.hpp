#pragma once
#include "json_rpc.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mcphost {

/// Splits a byte stream into newline-delimited frames, the framing used on
/// a server's stdin/stdout. CRLF terminators and blank lines are tolerated.
class LineFramer {
public:
    static constexpr size_t kDefaultMaxFrameSize = 16 * 1024 * 1024;

    explicit LineFramer(size_t max_frame_size = kDefaultMaxFrameSize);

    /// Append bytes and return every frame they complete, in order.
    /// A frame longer than the limit is discarded up to its terminator.
    [[nodiscard]] std::vector<std::string> feed(std::string_view bytes);

    [[nodiscard]] size_t buffered() const { return buffer_.size(); }
    [[nodiscard]] size_t dropped_frames() const { return dropped_; }
    void reset();

    /// Serialize and terminate a message for writing.
    [[nodiscard]] static std::string encode(const JsonRpcMessage& msg);

private:
    std::string buffer_;
    size_t max_frame_size_;
    size_t dropped_{0};
    bool discarding_{false};
};

} // namespace mcphost
