#include "frame_codec.hpp"

namespace bhumi {

const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::HELLO: return "HELLO";
        case MessageType::I_AM: return "I_AM";
        case MessageType::SEND: return "SEND";
        case MessageType::DELIVER: return "DELIVER";
        case MessageType::ACK: return "ACK";
        case MessageType::KEEPALIVE: return "KEEPALIVE";
        case MessageType::SEND_RESULT: return "SEND_RESULT";
        case MessageType::UPDATE_COMMITS: return "UPDATE_COMMITS";
        case MessageType::PRESENCE: return "PRESENCE";
        default: return "UNKNOWN";
    }
}

bool FrameCodec::is_known_type(uint16_t raw) {
    return raw >= static_cast<uint16_t>(MessageType::HELLO) &&
           raw <= static_cast<uint16_t>(MessageType::PRESENCE);
}

Bytes FrameCodec::encode(const Frame& frame, size_t max_frame_size) {
    if (frame.payload.size() > max_frame_size) {
        throw FramingError("Outgoing frame exceeds maximum size: " + std::to_string(frame.payload.size()));
    }

    const auto type = static_cast<uint16_t>(frame.type);
    const auto len = static_cast<uint32_t>(frame.payload.size());

    Bytes out;
    out.reserve(HEADER_SIZE + frame.payload.size());
    out.push_back(static_cast<uint8_t>(type >> 8));
    out.push_back(static_cast<uint8_t>(type));
    out.push_back(static_cast<uint8_t>(len >> 24));
    out.push_back(static_cast<uint8_t>(len >> 16));
    out.push_back(static_cast<uint8_t>(len >> 8));
    out.push_back(static_cast<uint8_t>(len));
    out.insert(out.end(), frame.payload.begin(), frame.payload.end());
    return out;
}

FrameDecoder::FrameDecoder(size_t max_frame_size)
    : max_frame_size_(max_frame_size) {}

void FrameDecoder::fail(const std::string& reason) {
    failed_ = true;
    buffer_.clear();
    read_pos_ = 0;
    throw FramingError(reason);
}

void FrameDecoder::feed(const uint8_t* data, size_t len) {
    if (failed_) {
        throw FramingError("Decoder already failed");
    }
    compact();
    // At most one partial frame plus one read chunk is ever pending between drains.
    if (buffered() + len > 2 * (FrameCodec::HEADER_SIZE + max_frame_size_)) {
        fail("Buffered input exceeds maximum bound");
    }
    buffer_.insert(buffer_.end(), data, data + len);
}

void FrameDecoder::compact() {
    if (read_pos_ == 0) return;
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
    read_pos_ = 0;
}

std::optional<Frame> FrameDecoder::next() {
    if (failed_) {
        throw FramingError("Decoder already failed");
    }

    if (buffered() < FrameCodec::HEADER_SIZE) {
        compact();
        return std::nullopt;
    }

    const uint8_t* h = buffer_.data() + read_pos_;
    const uint16_t raw_type = static_cast<uint16_t>((h[0] << 8) | h[1]);
    const uint32_t len = (static_cast<uint32_t>(h[2]) << 24) |
                         (static_cast<uint32_t>(h[3]) << 16) |
                         (static_cast<uint32_t>(h[4]) << 8) |
                         static_cast<uint32_t>(h[5]);

    if (!FrameCodec::is_known_type(raw_type)) {
        fail("Unknown frame type " + std::to_string(raw_type));
    }
    if (len > max_frame_size_) {
        fail("Declared frame length " + std::to_string(len) + " exceeds maximum " + std::to_string(max_frame_size_));
    }

    if (buffered() < FrameCodec::HEADER_SIZE + len) {
        return std::nullopt;
    }

    Frame frame;
    frame.type = static_cast<MessageType>(raw_type);
    auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_ + FrameCodec::HEADER_SIZE);
    frame.payload.assign(begin, begin + len);
    read_pos_ += FrameCodec::HEADER_SIZE + len;

    if (read_pos_ == buffer_.size()) {
        buffer_.clear();
        read_pos_ = 0;
    }
    return frame;
}

}
