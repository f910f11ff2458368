#pragma once

#include <functional>
#include <string>
#include <vector>

#include "types.hpp"

namespace bhumi {

// Abstract channel between relays, used only for best-effort presence gossip.
// The primary implementation is Redis pub/sub; a relay without one runs
// standalone.
class PeerTransport {
public:
    using MessageHandler = std::function<void(const Bytes& payload)>;

    virtual ~PeerTransport() = default;

    /**
     * Identifiers of the other relays currently reachable.
     * @return empty when the transport is down.
     */
    virtual std::vector<std::string> peers() = 0;

    /**
     * Sends an encoded PRESENCE record to one peer relay.
     * @return true if the transport accepted the message.
     */
    virtual bool publish(const std::string& peer_id, const Bytes& payload) = 0;

    // Handler for records gossiped to this relay. Called from a transport thread.
    virtual void set_message_handler(MessageHandler handler) = 0;
};

}
