#include "messages.hpp"

#include <algorithm>

namespace bhumi {

namespace {

class ByteWriter {
public:
    explicit ByteWriter(size_t reserve = 0) { out_.reserve(reserve); }

    void u8(uint8_t v) { out_.push_back(v); }
    void u16(uint16_t v) {
        out_.push_back(static_cast<uint8_t>(v >> 8));
        out_.push_back(static_cast<uint8_t>(v));
    }
    void u32(uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>(v >> shift));
        }
    }
    void u64(uint64_t v) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>(v >> shift));
        }
    }
    template<size_t N>
    void array(const std::array<uint8_t, N>& a) { out_.insert(out_.end(), a.begin(), a.end()); }
    void raw(const uint8_t* data, size_t len) { out_.insert(out_.end(), data, data + len); }

    // u32 length prefix followed by the bytes.
    void blob(const Bytes& b) {
        u32(static_cast<uint32_t>(b.size()));
        raw(b.data(), b.size());
    }

    Bytes take() { return std::move(out_); }

private:
    Bytes out_;
};

class ByteReader {
public:
    ByteReader(const Bytes& data, const char* what) : data_(data), what_(what) {}

    uint8_t u8() {
        need(1);
        return data_[pos_++];
    }
    uint16_t u16() {
        need(2);
        uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }
    uint32_t u32() {
        need(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v = (v << 8) | data_[pos_ + i];
        pos_ += 4;
        return v;
    }
    uint64_t u64() {
        need(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | data_[pos_ + i];
        pos_ += 8;
        return v;
    }
    template<size_t N>
    std::array<uint8_t, N> array() {
        need(N);
        std::array<uint8_t, N> a;
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), N, a.begin());
        pos_ += N;
        return a;
    }
    Bytes raw(size_t len) {
        need(len);
        auto begin = data_.begin() + static_cast<std::ptrdiff_t>(pos_);
        Bytes out(begin, begin + static_cast<std::ptrdiff_t>(len));
        pos_ += len;
        return out;
    }
    Bytes blob() {
        uint32_t len = u32();
        return raw(len);
    }

    // Trailing garbage is a layout violation, not something to ignore.
    void finish() const {
        if (pos_ != data_.size()) {
            throw MessageError(std::string(what_) + ": " + std::to_string(data_.size() - pos_) + " trailing bytes");
        }
    }

private:
    void need(size_t n) const {
        if (data_.size() - pos_ < n) {
            throw MessageError(std::string(what_) + " truncated");
        }
    }

    const Bytes& data_;
    const char* what_;
    size_t pos_ = 0;
};

}

Frame make_frame(MessageType type, Bytes payload) {
    return Frame{type, std::move(payload)};
}

Bytes Hello::encode() const {
    ByteWriter w(9);
    w.u8(version);
    w.u32(nonce);
    w.u32(max_payload_size);
    return w.take();
}

Hello Hello::decode(const Bytes& data) {
    ByteReader r(data, "HELLO");
    Hello h;
    h.version = r.u8();
    h.nonce = r.u32();
    h.max_payload_size = r.u32();
    r.finish();
    return h;
}

Bytes IAm::encode() const {
    ByteWriter w(32 + 64 + 2 + commits.size() * 32 + 2);
    w.array(id52);
    w.array(signature);
    w.u16(static_cast<uint16_t>(commits.size()));
    for (const auto& c : commits) w.array(c);
    w.u16(static_cast<uint16_t>(recent_responses.size()));
    for (const auto& rr : recent_responses) {
        w.array(rr.preimage);
        w.blob(rr.response);
    }
    return w.take();
}

IAm IAm::decode(const Bytes& data) {
    ByteReader r(data, "I_AM");
    IAm msg;
    msg.id52 = r.array<32>();
    msg.signature = r.array<64>();

    uint16_t commit_count = r.u16();
    msg.commits.reserve(commit_count);
    for (uint16_t i = 0; i < commit_count; ++i) {
        msg.commits.push_back(r.array<32>());
    }

    uint16_t response_count = r.u16();
    for (uint16_t i = 0; i < response_count; ++i) {
        RecentResponse rr;
        rr.preimage = r.array<32>();
        rr.response = r.blob();
        msg.recent_responses.push_back(std::move(rr));
    }
    r.finish();
    return msg;
}

Bytes SendRequest::encode() const {
    ByteWriter w(32 + 32 + 4 + payload.size());
    w.array(to_id52);
    w.array(preimage);
    w.blob(payload);
    return w.take();
}

SendRequest SendRequest::decode(const Bytes& data) {
    ByteReader r(data, "SEND");
    SendRequest msg;
    msg.to_id52 = r.array<32>();
    msg.preimage = r.array<32>();
    msg.payload = r.blob();
    r.finish();
    return msg;
}

Bytes Deliver::encode() const {
    ByteWriter w(8 + payload.size());
    w.u32(correlation_id);
    w.blob(payload);
    return w.take();
}

Deliver Deliver::decode(const Bytes& data) {
    ByteReader r(data, "DELIVER");
    Deliver msg;
    msg.correlation_id = r.u32();
    msg.payload = r.blob();
    r.finish();
    return msg;
}

Bytes Ack::encode() const {
    ByteWriter w(8 + payload.size());
    w.u32(correlation_id);
    w.blob(payload);
    return w.take();
}

Ack Ack::decode(const Bytes& data) {
    ByteReader r(data, "ACK");
    Ack msg;
    msg.correlation_id = r.u32();
    msg.payload = r.blob();
    r.finish();
    return msg;
}

Bytes SendResult::encode() const {
    ByteWriter w(5 + payload.size());
    w.u8(static_cast<uint8_t>(status));
    w.blob(payload);
    return w.take();
}

SendResult SendResult::decode(const Bytes& data) {
    ByteReader r(data, "SEND_RESULT");
    SendResult msg;
    uint8_t raw = r.u8();
    if (raw > static_cast<uint8_t>(SendStatus::RECIPIENT_DISCONNECTED)) {
        throw MessageError("SEND_RESULT unknown status " + std::to_string(raw));
    }
    msg.status = static_cast<SendStatus>(raw);
    msg.payload = r.blob();
    r.finish();
    return msg;
}

Bytes UpdateCommits::encode() const {
    ByteWriter w(2 + commits.size() * 32);
    w.u16(static_cast<uint16_t>(commits.size()));
    for (const auto& c : commits) w.array(c);
    return w.take();
}

UpdateCommits UpdateCommits::decode(const Bytes& data) {
    ByteReader r(data, "UPDATE_COMMITS");
    UpdateCommits msg;
    uint16_t count = r.u16();
    msg.commits.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        msg.commits.push_back(r.array<32>());
    }
    r.finish();
    return msg;
}

Bytes PresenceRecord::signed_bytes() const {
    ByteWriter w(32 + 8 + 4 + 1 + relay_id.size());
    w.array(id52);
    w.u64(issued_at);
    w.u32(ttl);
    w.u8(static_cast<uint8_t>(relay_id.size()));
    w.raw(reinterpret_cast<const uint8_t*>(relay_id.data()), relay_id.size());
    return w.take();
}

Bytes PresenceRecord::encode() const {
    if (relay_id.size() > 255) {
        throw MessageError("PRESENCE relay_id longer than 255 bytes");
    }
    Bytes out = signed_bytes();
    out.insert(out.end(), signature.begin(), signature.end());
    return out;
}

PresenceRecord PresenceRecord::decode(const Bytes& data) {
    ByteReader r(data, "PRESENCE");
    PresenceRecord rec;
    rec.id52 = r.array<32>();
    rec.issued_at = r.u64();
    rec.ttl = r.u32();
    uint8_t rlen = r.u8();
    Bytes rid = r.raw(rlen);
    rec.relay_id.assign(rid.begin(), rid.end());
    rec.signature = r.array<64>();
    r.finish();
    return rec;
}

}
