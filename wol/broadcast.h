#ifndef WOL_BROADCAST_H
#define WOL_BROADCAST_H

#include <cstdint>
#include <string>

#include <netinet/in.h>

#include "wol/magic_packet.h"
#include "wol/status.h"

namespace wol {

// IPv4 literal or host name, plus a UDP port.
struct endpoint {
    std::string host;
    uint16_t port;
};

const uint16_t default_wol_port = 9;

inline endpoint default_source() { return endpoint{"0.0.0.0", 0}; }
inline endpoint default_destination() { return endpoint{"255.255.255.255", default_wol_port}; }

status resolve(const endpoint& ep, sockaddr_in& out);

// Decimal 0-65535 with nothing trailing; `port` is only written on success.
bool parse_port(const std::string& text, uint16_t& port);

// Broadcasts from 0.0.0.0:0 to 255.255.255.255:9.
status send_magic(const magic_packet& packet);

// Binds a UDP socket to `source`, enables SO_BROADCAST and sends the packet
// to `destination` as a single datagram. The socket is closed before
// returning. Nothing is awaited or retried; any failing step is reported as
// errc::send_failure with the errno of that step.
status send_magic_to(const magic_packet& packet, const endpoint& source,
                     const endpoint& destination);

}  // namespace wol

#endif  // WOL_BROADCAST_H
