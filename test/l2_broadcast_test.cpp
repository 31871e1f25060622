#include "wol/l2_broadcast.h"

#include <cerrno>
#include <string>

#include <arpa/inet.h>
#include <sys/socket.h>

#include <catch2/catch.hpp>

#include "wol/socket.h"

TEST_CASE("query_interface") {
    wol::socket sock(::socket(AF_INET, SOCK_DGRAM, 0));
    REQUIRE(sock.valid());
    wol::interface_info info{};

    SECTION("loopback") {
        REQUIRE(wol::query_interface(sock.get(), "lo", info).ok());
        REQUIRE(info.index > 0);
        REQUIRE(info.mac == wol::mac_address{});
        REQUIRE(info.ip == htonl(INADDR_LOOPBACK));
    }

    SECTION("unknown interface") {
        wol::status st = wol::query_interface(sock.get(), "nosuchif0", info);
        REQUIRE(st.code == wol::errc::send_failure);
        REQUIRE(st.error == ENODEV);
        REQUIRE(std::string(st.op) == "ioctl(SIOCGIFINDEX)");
    }

    SECTION("name does not fit ifreq") {
        wol::status st = wol::query_interface(sock.get(), std::string(32, 'x'), info);
        REQUIRE(st.code == wol::errc::send_failure);
        REQUIRE(st.error == ENODEV);
    }
}
