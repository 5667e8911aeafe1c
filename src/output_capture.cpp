#include "output_capture.h"
#include <algorithm>

namespace contestrun {

namespace {

constexpr unsigned char STREAM_STDOUT = 1;
constexpr unsigned char STREAM_STDERR = 2;

} // namespace

void BoundedBuffer::append(const char* data, size_t len) {
    size_t room = capacity_ > data_.size() ? capacity_ - data_.size() : 0;
    size_t take = std::min(room, len);
    data_.append(data, take);
    dropped_ += len - take;
}

OutputCapture::OutputCapture(size_t per_stream_limit)
    : stdout_(per_stream_limit), stderr_(per_stream_limit) {}

void OutputCapture::feed(const char* data, size_t len) {
    size_t pos = 0;
    while (pos < len) {
        if (payload_remaining_ == 0) {
            // Collect the next frame header
            size_t need = HEADER_SIZE - header_filled_;
            size_t take = std::min(need, len - pos);
            std::copy(data + pos, data + pos + take, header_ + header_filled_);
            header_filled_ += take;
            pos += take;

            if (header_filled_ < HEADER_SIZE) {
                return;
            }

            current_stream_ = header_[0];
            payload_remaining_ = (static_cast<uint32_t>(header_[4]) << 24) |
                                 (static_cast<uint32_t>(header_[5]) << 16) |
                                 (static_cast<uint32_t>(header_[6]) << 8) |
                                 static_cast<uint32_t>(header_[7]);
            header_filled_ = 0;
            continue;
        }

        size_t take = std::min(static_cast<size_t>(payload_remaining_), len - pos);
        if (current_stream_ == STREAM_STDOUT) {
            stdout_.append(data + pos, take);
        } else if (current_stream_ == STREAM_STDERR) {
            stderr_.append(data + pos, take);
        }
        payload_remaining_ -= static_cast<uint32_t>(take);
        pos += take;
    }
}

} // namespace contestrun
