#ifndef WOL_MAC_H
#define WOL_MAC_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "wol/status.h"

namespace wol {

const size_t mac_size = 6;
// Six 2-digit octets joined by five separators.
const size_t mac_text_size = mac_size * 3 - 1;

typedef std::array<uint8_t, mac_size> mac_address;

// Parses "aa:bb:cc:dd:ee:ff" (any single separator character, hex digits in
// either case). The length is checked before the text is split, so a
// misplaced separator is always a format error, never a different MAC.
// `out` is only written on success.
status parse_mac(const std::string& text, char sep, mac_address& out);

// First of ':', '-' or '/' present in `text`; ':' if none is.
char infer_separator(const std::string& text);

std::string format_mac(const mac_address& mac, char sep = ':');

}  // namespace wol

#endif  // WOL_MAC_H
