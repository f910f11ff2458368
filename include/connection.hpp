#pragma once

#include <atomic>
#include <string>

#include "frame_codec.hpp"
#include "types.hpp"

namespace bhumi {

// A live transport session as seen by the relay core. Relay sessions implement
// it over TCP/TLS; the core never touches sockets directly.
class Connection {
public:
    virtual ~Connection() = default;

    // Queues a frame for asynchronous delivery. Returns false when the
    // connection is already closed and the frame was dropped.
    virtual bool send_frame(Frame frame) = 0;

    // Closes the transport. Idempotent; teardown (unbind) follows through the
    // close handler of the owning session.
    virtual void close() = 0;

    virtual std::string remote_address() const = 0;

    virtual bool is_open() const = 0;

    uint32_t nonce() const { return nonce_; }
    void set_nonce(uint32_t nonce) { nonce_ = nonce; }

    ConnectionHandle handle() const { return handle_.load(); }
    void set_handle(ConnectionHandle handle) { handle_.store(handle); }

private:
    uint32_t nonce_ = 0;
    std::atomic<ConnectionHandle> handle_{0};
};

}
