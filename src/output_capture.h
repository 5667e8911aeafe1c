#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace contestrun {

// Append-only buffer with a hard byte ceiling. Bytes past the ceiling are
// counted and discarded as they arrive, so memory stays bounded no matter
// how much the sandboxed program writes.
class BoundedBuffer {
public:
    explicit BoundedBuffer(size_t capacity) : capacity_(capacity) {}

    void append(const char* data, size_t len);

    const std::string& str() const { return data_; }
    size_t dropped() const { return dropped_; }
    bool truncated() const { return dropped_ > 0; }

private:
    size_t capacity_;
    std::string data_;
    size_t dropped_ = 0;
};

// Splits Docker's multiplexed log stream (8-byte frame header: stream id,
// three zero bytes, big-endian payload length) into bounded stdout and
// stderr buffers. Frames may be split across feed() calls arbitrarily.
// Owned and fed by exactly one reader thread; read only after that thread
// has been joined.
class OutputCapture {
public:
    explicit OutputCapture(size_t per_stream_limit);

    void feed(const char* data, size_t len);

    const BoundedBuffer& stdout_buffer() const { return stdout_; }
    const BoundedBuffer& stderr_buffer() const { return stderr_; }

private:
    static constexpr size_t HEADER_SIZE = 8;

    BoundedBuffer stdout_;
    BoundedBuffer stderr_;

    unsigned char header_[HEADER_SIZE];
    size_t header_filled_ = 0;
    uint32_t payload_remaining_ = 0;
    unsigned char current_stream_ = 0;
};

} // namespace contestrun
