#include "wol/magic_packet.h"

#include <algorithm>
#include <cstring>

namespace wol {

magic_packet build_magic_packet(const mac_address& mac) {
    magic_packet packet;
    std::fill(packet.begin(), packet.begin() + magic_header_size, 0xFF);
    for (size_t i = 0; i < magic_repeat; i++)
        std::copy(mac.begin(), mac.end(), packet.begin() + magic_header_size + i * mac_size);
    return packet;
}

status build_magic_packet(const uint8_t* bytes, size_t len, magic_packet& out) {
    if (bytes == nullptr || len != mac_size) return failure(errc::invalid_mac_length);

    mac_address mac;
    std::copy(bytes, bytes + mac_size, mac.begin());
    out = build_magic_packet(mac);
    return success();
}

status parse_magic_packet(const uint8_t* data, size_t len, mac_address& out) {
    if (data == nullptr || len != magic_packet_size) return failure(errc::invalid_mac_length);

    for (size_t i = 0; i < magic_header_size; i++)
        if (data[i] != 0xFF) return failure(errc::invalid_packet);

    const uint8_t* first = data + magic_header_size;
    for (size_t i = 1; i < magic_repeat; i++)
        if (std::memcmp(first, first + i * mac_size, mac_size) != 0)
            return failure(errc::invalid_packet);

    std::copy(first, first + mac_size, out.begin());
    return success();
}

}  // namespace wol
