#include <iostream>
#include <string>

#include "wol/broadcast.h"
#include "wol/mac.h"
#include "wol/magic_packet.h"
#include "wol/status.h"

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <mac> [dst_host] [dst_port] [src_host] [src_port]\n"
              << "  mac: AA:BB:CC:DD:EE:FF, AA-BB-CC-DD-EE-FF or AA/BB/CC/DD/EE/FF\n"
              << "  defaults: dst 255.255.255.255:9, src 0.0.0.0:0\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 6) {
        usage(argv[0]);
        return 1;
    }

    std::string mac_str = argv[1];
    wol::endpoint dst = wol::default_destination();
    wol::endpoint src = wol::default_source();
    if (argc >= 3) dst.host = argv[2];
    if (argc >= 4 && !wol::parse_port(argv[3], dst.port)) {
        std::cerr << "Bad dst_port: " << argv[3] << "\n";
        return 1;
    }
    if (argc >= 5) src.host = argv[4];
    if (argc >= 6 && !wol::parse_port(argv[5], src.port)) {
        std::cerr << "Bad src_port: " << argv[5] << "\n";
        return 1;
    }

    wol::mac_address mac;
    wol::status st = wol::parse_mac(mac_str, wol::infer_separator(mac_str), mac);
    if (!st.ok()) {
        std::cerr << "Bad mac '" << mac_str << "': " << wol::to_string(st) << "\n";
        usage(argv[0]);
        return 1;
    }

    const wol::magic_packet packet = wol::build_magic_packet(mac);

    st = (argc == 2) ? wol::send_magic(packet) : wol::send_magic_to(packet, src, dst);
    if (!st.ok()) {
        std::cerr << "Failed to send the magic packet: " << wol::to_string(st) << "\n";
        return 1;
    }

    std::cout << "Sent the magic packet to " << wol::format_mac(mac)
              << " via " << dst.host << ":" << dst.port << ".\n";
    return 0;
}
