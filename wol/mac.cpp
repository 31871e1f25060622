#include "wol/mac.h"

#include <cctype>

namespace wol {

static int hex(char c) {
    c = (char)std::tolower((unsigned char)c);
    if ('0' <= c && c <= '9') return c - '0';
    if ('a' <= c && c <= 'f') return 10 + (c - 'a');
    return -1;
}

status parse_mac(const std::string& text, char sep, mac_address& out) {
    if (text.size() != mac_text_size) return failure(errc::invalid_mac_length);

    mac_address mac{};
    size_t fields = 0;
    size_t start = 0;
    while (true) {
        size_t end = text.find(sep, start);
        if (end == std::string::npos) end = text.size();

        if (fields == mac_size) return failure(errc::invalid_mac_format);
        if (end - start != 2) return failure(errc::invalid_mac_format);
        int hi = hex(text[start]);
        int lo = hex(text[start + 1]);
        if (hi < 0 || lo < 0) return failure(errc::invalid_mac_format);
        mac[fields++] = (uint8_t)((hi << 4) | lo);

        if (end == text.size()) break;
        start = end + 1;
    }
    if (fields != mac_size) return failure(errc::invalid_mac_format);

    out = mac;
    return success();
}

char infer_separator(const std::string& text) {
    size_t pos = text.find_first_of(":-/");
    return pos == std::string::npos ? ':' : text[pos];
}

std::string format_mac(const mac_address& mac, char sep) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(mac_text_size);
    for (size_t i = 0; i < mac.size(); i++) {
        if (i != 0) out += sep;
        out += digits[mac[i] >> 4];
        out += digits[mac[i] & 0x0F];
    }
    return out;
}

}  // namespace wol
