#include "wol/status.h"

#include <cerrno>
#include <cstring>
#include <netdb.h>

namespace wol {

status system_failure(const char* op) {
    return status{errc::send_failure, origin::system, errno, op};
}

status resolver_failure(int eai_code) {
    return status{errc::send_failure, origin::resolver, eai_code, "getaddrinfo"};
}

const char* describe(errc code) {
    switch (code) {
    case errc::ok:                 return "success";
    case errc::invalid_mac_length: return "invalid MAC address length";
    case errc::invalid_mac_format: return "invalid MAC address format";
    case errc::invalid_packet:     return "not a magic packet";
    case errc::send_failure:       return "send failure";
    }
    return "unknown error";
}

std::string to_string(const status& st) {
    std::string out = describe(st.code);
    if (st.op) {
        out += ": ";
        out += st.op;
    }
    if (st.source == origin::system) {
        out += ": ";
        out += std::strerror(st.error);
    } else if (st.source == origin::resolver) {
        out += ": ";
        out += gai_strerror(st.error);
    }
    return out;
}

}  // namespace wol
