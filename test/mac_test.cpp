#include "wol/mac.h"

#include <catch2/catch.hpp>

TEST_CASE("parse_mac") {
    wol::mac_address mac{};

    SECTION("colon separated") {
        REQUIRE(wol::parse_mac("01:02:03:04:05:06", ':', mac).ok());
        REQUIRE(mac == (wol::mac_address{{0x01, 0x02, 0x03, 0x04, 0x05, 0x06}}));
    }

    SECTION("dash and slash separated") {
        REQUIRE(wol::parse_mac("1a-2B-3c-D4-e5-F6", '-', mac).ok());
        REQUIRE(mac == (wol::mac_address{{0x1a, 0x2b, 0x3c, 0xd4, 0xe5, 0xf6}}));

        REQUIRE(wol::parse_mac("ff/00/ff/00/ff/00", '/', mac).ok());
        REQUIRE(mac == (wol::mac_address{{0xff, 0x00, 0xff, 0x00, 0xff, 0x00}}));
    }

    SECTION("too short") {
        REQUIRE(wol::parse_mac("01:02:03:04:05", ':', mac).code == wol::errc::invalid_mac_length);
        REQUIRE(wol::parse_mac("", ':', mac).code == wol::errc::invalid_mac_length);
    }

    SECTION("too long") {
        REQUIRE(wol::parse_mac("01:02:03:04:05:06:07", ':', mac).code == wol::errc::invalid_mac_length);
        REQUIRE(wol::parse_mac("01:02:03:04:05:06 ", ':', mac).code == wol::errc::invalid_mac_length);
    }

    SECTION("non-hex field") {
        REQUIRE(wol::parse_mac("ZZ:02:03:04:05:06", ':', mac).code == wol::errc::invalid_mac_format);
        REQUIRE(wol::parse_mac("01:02:03:04:05:0g", ':', mac).code == wol::errc::invalid_mac_format);
    }

    SECTION("misplaced separator") {
        REQUIRE(wol::parse_mac("01002:03:04:05:06", ':', mac).code == wol::errc::invalid_mac_format);
        REQUIRE(wol::parse_mac("0:102:03:04:05:06", ':', mac).code == wol::errc::invalid_mac_format);
    }

    SECTION("wrong separator") {
        REQUIRE(wol::parse_mac("01-02-03-04-05-06", ':', mac).code == wol::errc::invalid_mac_format);
        REQUIRE(wol::parse_mac("01:02-03:04:05:06", ':', mac).code == wol::errc::invalid_mac_format);
    }

    SECTION("output untouched on failure") {
        wol::mac_address before{{0xde, 0xad, 0xbe, 0xef, 0x00, 0x01}};
        mac = before;
        REQUIRE_FALSE(wol::parse_mac("01:02:03:04:05:ZZ", ':', mac).ok());
        REQUIRE(mac == before);
    }
}

TEST_CASE("infer_separator") {
    REQUIRE(wol::infer_separator("01:02:03:04:05:06") == ':');
    REQUIRE(wol::infer_separator("01-02-03-04-05-06") == '-');
    REQUIRE(wol::infer_separator("01/02/03/04/05/06") == '/');
    REQUIRE(wol::infer_separator("01-02:03:04:05:06") == '-');
    REQUIRE(wol::infer_separator("010203040506") == ':');
}

TEST_CASE("format_mac") {
    wol::mac_address mac{};
    REQUIRE(wol::parse_mac("AA-BB-CC-0D-0E-0F", '-', mac).ok());
    REQUIRE(wol::format_mac(mac) == "aa:bb:cc:0d:0e:0f");
    REQUIRE(wol::format_mac(mac, '-') == "aa-bb-cc-0d-0e-0f");
}
