#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace bhumi {

enum class MessageType : uint16_t {
    HELLO = 0x0001,
    I_AM = 0x0002,
    SEND = 0x0003,
    DELIVER = 0x0004,
    ACK = 0x0005,
    KEEPALIVE = 0x0006,
    SEND_RESULT = 0x0007,
    UPDATE_COMMITS = 0x0008,
    PRESENCE = 0x0009
};

const char* message_type_to_string(MessageType type);

// Raised on any unrecoverable framing problem. The connection must be closed.
class FramingError : public std::runtime_error {
public:
    explicit FramingError(const std::string& what) : std::runtime_error(what) {}
};

struct Frame {
    MessageType type = MessageType::KEEPALIVE;
    Bytes payload;
};

// Wire layout: u16 type (BE) | u32 length (BE) | payload.
class FrameCodec {
public:
    static constexpr size_t HEADER_SIZE = 6;
    static constexpr size_t DEFAULT_MAX_FRAME_SIZE = 1024 * 1024;

    static bool is_known_type(uint16_t raw);

    // Serializes a frame. Throws FramingError if the payload exceeds max_frame_size.
    static Bytes encode(const Frame& frame, size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);
};

// Incremental decoder over a byte stream. Feed bytes as they arrive and pull
// complete frames with next() until it returns nullopt. Once a FramingError
// has been thrown the decoder stays failed.
class FrameDecoder {
public:
    explicit FrameDecoder(size_t max_frame_size = FrameCodec::DEFAULT_MAX_FRAME_SIZE);

    void feed(const uint8_t* data, size_t len);
    void feed(const Bytes& data) { feed(data.data(), data.size()); }

    std::optional<Frame> next();

    size_t buffered() const { return buffer_.size() - read_pos_; }
    bool failed() const { return failed_; }

private:
    [[noreturn]] void fail(const std::string& reason);
    void compact();

    size_t max_frame_size_;
    Bytes buffer_;
    size_t read_pos_ = 0;
    bool failed_ = false;
};

}
