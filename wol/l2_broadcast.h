#ifndef WOL_L2_BROADCAST_H
#define WOL_L2_BROADCAST_H

#include <cstdint>
#include <string>

#include "wol/broadcast.h"
#include "wol/mac.h"
#include "wol/magic_packet.h"
#include "wol/status.h"

namespace wol {

struct interface_info {
    int index;
    mac_address mac;
    uint32_t ip;  // network byte order, 0 when the interface has no IPv4 address
};

status query_interface(int fd, const std::string& name, interface_info& out);

// Sends the packet as a hand-built Ethernet/IPv4/UDP broadcast frame on
// `iface`, bypassing the routing table. Requires CAP_NET_RAW.
status send_magic_l2(const magic_packet& packet, const std::string& iface,
                     uint16_t port = default_wol_port);

}  // namespace wol

#endif  // WOL_L2_BROADCAST_H
