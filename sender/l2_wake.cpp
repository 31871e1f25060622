#include <iostream>
#include <string>

#include "wol/broadcast.h"
#include "wol/l2_broadcast.h"
#include "wol/mac.h"
#include "wol/magic_packet.h"
#include "wol/status.h"

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: sudo " << argv[0] << " <iface> <mac> [dst_port]\n";
        return 1;
    }
    std::string iface = argv[1];
    std::string mac_str = argv[2];

    uint16_t dst_port = wol::default_wol_port;
    if (argc == 4) {
        if (!wol::parse_port(argv[3], dst_port)) {
            std::cerr << "Bad dst_port: " << argv[3] << "\n";
            return 1;
        }
    }

    wol::mac_address mac;
    wol::status st = wol::parse_mac(mac_str, wol::infer_separator(mac_str), mac);
    if (!st.ok()) {
        std::cerr << "Bad mac '" << mac_str << "': " << wol::to_string(st) << "\n";
        return 1;
    }

    const wol::magic_packet packet = wol::build_magic_packet(mac);

    st = wol::send_magic_l2(packet, iface, dst_port);
    if (!st.ok()) {
        std::cerr << "Failed to send the magic packet on " << iface << ": "
                  << wol::to_string(st) << "\n";
        return 1;
    }

    std::cout << "Sent the magic packet to " << wol::format_mac(mac)
              << " on " << iface << " (udp port " << dst_port << ").\n";
    return 0;
}
