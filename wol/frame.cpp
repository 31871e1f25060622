#include "wol/frame.h"

#include <cstring>
#include <net/ethernet.h>

namespace wol {

frame_params default_frame_params() {
    frame_params p;
    p.src_mac.fill(0);
    p.dst_mac.fill(0xFF);
    p.src_ip = htonl(INADDR_ANY);
    p.dst_ip = htonl(INADDR_BROADCAST);
    p.src_port = 9;
    p.dst_port = 9;
    return p;
}

// One's complement sum of 16-bit words, not yet folded.
static uint32_t add_words(uint32_t sum, const void* data, size_t len) {
    const uint16_t* p = (const uint16_t*)data;
    while (len > 1) { sum += *p++; len -= 2; }
    if (len == 1) sum += *(const uint8_t*)p;
    return sum;
}

static uint16_t fold(uint32_t sum) {
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return (uint16_t)(~sum);
}

uint16_t csum16(const void* data, size_t len) {
    return fold(add_words(0, data, len));
}

uint16_t udp_checksum(const iphdr* ip, const udphdr* udp,
                      const uint8_t* payload, size_t payload_len) {
    struct pseudo_header {
        uint32_t saddr;
        uint32_t daddr;
        uint8_t  zero;
        uint8_t  proto;
        uint16_t udp_len;
    } ph{};
    ph.saddr   = ip->saddr;
    ph.daddr   = ip->daddr;
    ph.proto   = IPPROTO_UDP;
    ph.udp_len = udp->len;

    uint32_t sum = add_words(0, &ph, sizeof(ph));
    sum = add_words(sum, udp, sizeof(udphdr));
    sum = add_words(sum, payload, payload_len);

    uint16_t out = fold(sum);
    // 0 means "no checksum" on the wire.
    return out ? out : 0xFFFF;
}

std::vector<uint8_t> build_udp_frame(const frame_params& params,
                                     const uint8_t* payload, size_t payload_len) {
    std::vector<uint8_t> frame(frame_overhead + payload_len);

    auto* eth = (ether_header*)frame.data();
    std::memcpy(eth->ether_dhost, params.dst_mac.data(), mac_size);
    std::memcpy(eth->ether_shost, params.src_mac.data(), mac_size);
    eth->ether_type = htons(ETHERTYPE_IP);

    auto* ip = (iphdr*)(frame.data() + ether_header_size);
    ip->ihl = 5;
    ip->version = 4;
    ip->tos = 0;
    ip->tot_len = htons(sizeof(iphdr) + sizeof(udphdr) + payload_len);
    ip->id = 0;
    ip->frag_off = 0;
    ip->ttl = 64;
    ip->protocol = IPPROTO_UDP;
    ip->check = 0;
    ip->saddr = params.src_ip;
    ip->daddr = params.dst_ip;
    ip->check = csum16(ip, sizeof(iphdr));

    auto* udp = (udphdr*)(frame.data() + ether_header_size + sizeof(iphdr));
    udp->source = htons(params.src_port);
    udp->dest   = htons(params.dst_port);
    udp->len    = htons(sizeof(udphdr) + payload_len);
    udp->check  = 0;

    uint8_t* pl = frame.data() + frame_overhead;
    if (payload_len) std::memcpy(pl, payload, payload_len);
    udp->check = udp_checksum(ip, udp, pl, payload_len);

    return frame;
}

}  // namespace wol
