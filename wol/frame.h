#ifndef WOL_FRAME_H
#define WOL_FRAME_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/udp.h>

#include "wol/mac.h"

namespace wol {

const size_t ether_header_size = 14;
const size_t frame_overhead = ether_header_size + sizeof(iphdr) + sizeof(udphdr);

// IPv4 addresses in network byte order, ports in host byte order.
struct frame_params {
    mac_address src_mac;
    mac_address dst_mac;
    uint32_t src_ip;
    uint32_t dst_ip;
    uint16_t src_port;
    uint16_t dst_port;
};

// Broadcast MAC and IP, port 9 on both ends, zero source addresses.
frame_params default_frame_params();

uint16_t csum16(const void* data, size_t len);
uint16_t udp_checksum(const iphdr* ip, const udphdr* udp,
                      const uint8_t* payload, size_t payload_len);

// Ethernet II + IPv4 + UDP around `payload`, checksums filled in.
std::vector<uint8_t> build_udp_frame(const frame_params& params,
                                     const uint8_t* payload, size_t payload_len);

}  // namespace wol

#endif  // WOL_FRAME_H
