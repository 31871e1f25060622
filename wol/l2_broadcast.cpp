#include "wol/l2_broadcast.h"

#include <cerrno>
#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <net/ethernet.h>
#include <net/if.h>
#include <netpacket/packet.h>
#include <sys/ioctl.h>
#include <sys/socket.h>

#include "wol/frame.h"
#include "wol/socket.h"

namespace wol {

status query_interface(int fd, const std::string& name, interface_info& out) {
    if (name.empty() || name.size() >= IFNAMSIZ) {
        errno = ENODEV;
        return system_failure("ifreq");
    }

    ifreq ifr{};
    std::strncpy(ifr.ifr_name, name.c_str(), IFNAMSIZ - 1);

    interface_info info;
    if (ioctl(fd, SIOCGIFINDEX, &ifr) < 0) return system_failure("ioctl(SIOCGIFINDEX)");
    info.index = ifr.ifr_ifindex;

    if (ioctl(fd, SIOCGIFHWADDR, &ifr) < 0) return system_failure("ioctl(SIOCGIFHWADDR)");
    std::memcpy(info.mac.data(), ifr.ifr_hwaddr.sa_data, mac_size);

    // Links without an IPv4 address still get the frame, from 0.0.0.0.
    if (ioctl(fd, SIOCGIFADDR, &ifr) < 0) {
        if (errno != EADDRNOTAVAIL) return system_failure("ioctl(SIOCGIFADDR)");
        info.ip = htonl(INADDR_ANY);
    } else {
        auto* sin = (sockaddr_in*)&ifr.ifr_addr;
        info.ip = sin->sin_addr.s_addr;
    }

    out = info;
    return success();
}

status send_magic_l2(const magic_packet& packet, const std::string& iface, uint16_t port) {
    wol::socket sock(::socket(AF_PACKET, SOCK_RAW, htons(ETH_P_ALL)));
    if (!sock.valid()) return system_failure("socket(AF_PACKET)");

    interface_info info;
    status st = query_interface(sock.get(), iface, info);
    if (!st.ok()) return st;

    frame_params params = default_frame_params();
    params.src_mac = info.mac;
    params.src_ip = info.ip;
    params.dst_port = port;
    std::vector<uint8_t> frame = build_udp_frame(params, packet.data(), packet.size());

    sockaddr_ll addr{};
    addr.sll_family = AF_PACKET;
    addr.sll_ifindex = info.index;
    addr.sll_halen = mac_size;
    std::memcpy(addr.sll_addr, params.dst_mac.data(), mac_size);

    ssize_t n = sendto(sock.get(), frame.data(), frame.size(), 0,
                       (sockaddr*)&addr, sizeof(addr));
    if (n < 0) return system_failure("sendto");
    if ((size_t)n != frame.size()) {
        errno = EMSGSIZE;
        return system_failure("sendto");
    }
    return success();
}

}  // namespace wol
