#include "wol/broadcast.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <exception>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

#include "wol/socket.h"

namespace wol {

status resolve(const endpoint& ep, sockaddr_in& out) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* res = nullptr;
    int rc = getaddrinfo(ep.host.c_str(), nullptr, &hints, &res);
    if (rc != 0) {
        if (rc == EAI_SYSTEM) return system_failure("getaddrinfo");
        return resolver_failure(rc);
    }

    std::memcpy(&out, res->ai_addr, sizeof(sockaddr_in));
    out.sin_port = htons(ep.port);
    freeaddrinfo(res);
    return success();
}

bool parse_port(const std::string& text, uint16_t& port) {
    if (text.empty() || !std::isdigit((unsigned char)text[0])) return false;
    unsigned long value;
    try {
        size_t used = 0;
        value = std::stoul(text, &used, 10);
        if (used != text.size()) return false;
    } catch (const std::exception&) {
        return false;
    }
    if (value > 65535) return false;
    port = (uint16_t)value;
    return true;
}

status send_magic(const magic_packet& packet) {
    return send_magic_to(packet, default_source(), default_destination());
}

status send_magic_to(const magic_packet& packet, const endpoint& source,
                     const endpoint& destination) {
    sockaddr_in src_addr;
    status st = resolve(source, src_addr);
    if (!st.ok()) return st;

    sockaddr_in dst_addr;
    st = resolve(destination, dst_addr);
    if (!st.ok()) return st;

    wol::socket sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) return system_failure("socket");

    if (bind(sock.get(), (sockaddr*)&src_addr, sizeof(src_addr)) < 0)
        return system_failure("bind");

    int on = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0)
        return system_failure("setsockopt(SO_BROADCAST)");

    ssize_t n = sendto(sock.get(), packet.data(), packet.size(), 0,
                       (sockaddr*)&dst_addr, sizeof(dst_addr));
    if (n < 0) return system_failure("sendto");
    if ((size_t)n != packet.size()) {
        errno = EMSGSIZE;
        return system_failure("sendto");
    }
    return success();
}

}  // namespace wol
