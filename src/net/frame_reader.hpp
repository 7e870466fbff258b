#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace facetmcp::net {

// Splits a byte stream into newline-delimited frames. A frame longer than
// the limit (complete or still arriving) latches overflowed().
class FrameReader {
public:
    explicit FrameReader(std::size_t max_frame_bytes = 1024 * 1024)
        : max_frame_bytes_(max_frame_bytes) {}

    void append(const char* data, std::size_t size) {
        buffer_.append(data, size);
        if (buffer_.find('\n') == std::string::npos && buffer_.size() > max_frame_bytes_) {
            overflowed_ = true;
        }
    }

    // Next complete frame without its "\n" (and without a trailing "\r").
    std::optional<std::string> next_frame() {
        if (overflowed_) {
            return std::nullopt;
        }
        const auto pos = buffer_.find('\n');
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        if (pos > max_frame_bytes_) {
            overflowed_ = true;
            return std::nullopt;
        }

        std::string frame = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!frame.empty() && frame.back() == '\r') {
            frame.pop_back();
        }
        return frame;
    }

    bool overflowed() const { return overflowed_; }
    std::size_t pending_bytes() const { return buffer_.size(); }

private:
    std::size_t max_frame_bytes_;
    std::string buffer_;
    bool overflowed_ = false;
};

}  // namespace facetmcp::net
