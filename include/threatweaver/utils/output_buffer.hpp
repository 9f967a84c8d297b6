/**
 * @file output_buffer.hpp
 * @brief Size-capped accumulation of streamed process output
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace threatweaver {
namespace utils {

/**
 * @class BoundedOutputBuffer
 * @brief Append-only text buffer that stops growing at a byte ceiling
 *
 * Output from hostile tools is appended chunk by chunk as it arrives. Bytes
 * past the ceiling are counted and dropped, and the buffer remembers that
 * truncation happened. A ceiling of 0 keeps nothing.
 */
class BoundedOutputBuffer {
public:
    explicit BoundedOutputBuffer(std::size_t max_bytes) : max_bytes_(max_bytes) {}

    /// Append a chunk, keeping only what fits under the ceiling.
    void Append(const char* data, std::size_t length) {
        total_bytes_ += length;
        if (data_.size() >= max_bytes_) {
            truncated_ = truncated_ || length > 0;
            return;
        }
        std::size_t room = max_bytes_ - data_.size();
        if (length > room) {
            data_.append(data, room);
            truncated_ = true;
        } else {
            data_.append(data, length);
        }
    }

    void Append(const std::string& chunk) { Append(chunk.data(), chunk.size()); }

    const std::string& Data() const { return data_; }
    std::string Release() { return std::move(data_); }

    bool Truncated() const { return truncated_; }
    std::size_t TotalBytes() const { return total_bytes_; }
    std::size_t MaxBytes() const { return max_bytes_; }

private:
    std::size_t max_bytes_;
    std::string data_;
    std::size_t total_bytes_{0};
    bool truncated_{false};
};

} // namespace utils
} // namespace threatweaver
