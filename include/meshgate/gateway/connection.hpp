#ifndef MESHGATE_GATEWAY_CONNECTION_HPP
#define MESHGATE_GATEWAY_CONNECTION_HPP

#include <string>
#include <memory>

namespace meshgate {

// Delivery handle for one client. Implemented by the WebSocket
// connection wrapper and by the HTTP bridge mailbox.
class Connection {
public:
    virtual ~Connection() {}

    // Queue one text frame. False if the peer is gone.
    virtual bool send(const std::string& text) = 0;

    // Close the transport. Idempotent.
    virtual void close() = 0;

    // "ws" or "http"
    virtual const char* transport() const = 0;
};

typedef std::shared_ptr<Connection> ConnectionPtr;

} // namespace meshgate

#endif // MESHGATE_GATEWAY_CONNECTION_HPP
