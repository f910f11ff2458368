#pragma once

#include <condition_variable>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include "connection.hpp"
#include "identity_verifier.hpp"
#include "messages.hpp"
#include "peer_transport.hpp"

namespace bhumi::testing {

// In-memory connection that records every frame the relay sends it.
class FakeConnection : public Connection {
public:
    explicit FakeConnection(std::string addr = "10.0.0.1") : addr_(std::move(addr)) {}

    bool send_frame(Frame frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return false;
        frames_.push_back(std::move(frame));
        cv_.notify_all();
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        ++close_calls_;
        cv_.notify_all();
    }

    std::string remote_address() const override { return addr_; }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    int close_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_calls_;
    }

    std::vector<Frame> frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {frames_.begin(), frames_.end()};
    }

    std::vector<Frame> frames_of(MessageType type) const {
        std::vector<Frame> out;
        for (auto& f : frames()) {
            if (f.type == type) out.push_back(std::move(f));
        }
        return out;
    }

    // Blocks until a frame of `type` shows up, then removes and returns it.
    std::optional<Frame> wait_for(MessageType type,
                                  std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(mutex_);
        std::optional<Frame> found;
        cv_.wait_for(lock, timeout, [&] {
            for (auto it = frames_.begin(); it != frames_.end(); ++it) {
                if (it->type == type) {
                    found = std::move(*it);
                    frames_.erase(it);
                    return true;
                }
            }
            return false;
        });
        return found;
    }

private:
    std::string addr_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Frame> frames_;
    bool open_ = true;
    int close_calls_ = 0;
};

// Ed25519 keypair generated with OpenSSL for signing test handshakes and
// presence records.
class TestIdentity {
public:
    TestIdentity() {
        EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
        if (!ctx || EVP_PKEY_keygen_init(ctx) != 1 || EVP_PKEY_keygen(ctx, &pkey_) != 1) {
            EVP_PKEY_CTX_free(ctx);
            throw std::runtime_error("Ed25519 keygen failed");
        }
        EVP_PKEY_CTX_free(ctx);

        size_t len = id52_.size();
        if (EVP_PKEY_get_raw_public_key(pkey_, id52_.data(), &len) != 1) {
            throw std::runtime_error("Ed25519 public key export failed");
        }
    }

    ~TestIdentity() { EVP_PKEY_free(pkey_); }

    TestIdentity(const TestIdentity&) = delete;
    TestIdentity& operator=(const TestIdentity&) = delete;

    const Id52& id52() const { return id52_; }

    Signature sign(const Bytes& message) const {
        Signature sig{};
        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        size_t len = sig.size();
        bool ok = ctx &&
                  EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, pkey_) == 1 &&
                  EVP_DigestSign(ctx, sig.data(), &len, message.data(), message.size()) == 1;
        EVP_MD_CTX_free(ctx);
        if (!ok) {
            throw std::runtime_error("Ed25519 sign failed");
        }
        return sig;
    }

    Signature sign_handshake(uint32_t nonce) const {
        return sign(handshake_message(nonce, id52_));
    }

    PresenceRecord presence(uint64_t issued_at, uint32_t ttl, const std::string& relay_id = "relay-a") const {
        PresenceRecord rec;
        rec.id52 = id52_;
        rec.issued_at = issued_at;
        rec.ttl = ttl;
        rec.relay_id = relay_id;
        rec.signature = sign(rec.signed_bytes());
        return rec;
    }

private:
    EVP_PKEY* pkey_ = nullptr;
    Id52 id52_{};
};

inline Preimage random_preimage() {
    Preimage p;
    if (RAND_bytes(p.data(), static_cast<int>(p.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return p;
}

inline Id52 filled_id(uint8_t v) {
    Id52 id;
    id.fill(v);
    return id;
}

inline Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

// Verifier that accepts every signature; lets registry tests use plain ids.
class AcceptAllVerifier : public IdentityVerifier {
public:
    bool verify(const Id52&, const Bytes&, const Signature&) const override { return true; }
};

// Records what the presence layer publishes to other relays.
class FakePeerTransport : public PeerTransport {
public:
    std::vector<std::string> peers() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return peer_ids;
    }

    bool publish(const std::string& peer_id, const Bytes& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_publish) return false;
        published[peer_id].push_back(payload);
        return true;
    }

    void set_message_handler(MessageHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    // Simulates a gossip message arriving from another relay.
    void inject(const Bytes& payload) {
        MessageHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }
        if (handler) handler(payload);
    }

    bool has_handler() {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(handler_);
    }

    std::vector<std::string> peer_ids;
    std::map<std::string, std::vector<Bytes>> published;
    bool fail_publish = false;

private:
    std::mutex mutex_;
    MessageHandler handler_;
};

}
