#include "wol/socket.h"

#include <type_traits>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/socket.h>

#include <catch2/catch.hpp>

static_assert(std::is_nothrow_move_constructible<wol::socket>::value, "socket must move without throwing");
static_assert(std::is_nothrow_move_assignable<wol::socket>::value, "socket must move without throwing");
static_assert(!std::is_copy_constructible<wol::socket>::value, "socket owns its descriptor");

static bool is_open(int fd) {
    return fcntl(fd, F_GETFD) != -1;
}

TEST_CASE("socket") {
    SECTION("closes on scope exit") {
        int fd;
        {
            wol::socket sock(::socket(AF_INET, SOCK_DGRAM, 0));
            REQUIRE(sock.valid());
            fd = sock.get();
            REQUIRE(is_open(fd));
        }
        REQUIRE_FALSE(is_open(fd));
    }

    SECTION("move transfers ownership") {
        wol::socket a(::socket(AF_INET, SOCK_DGRAM, 0));
        int fd = a.get();
        wol::socket b(std::move(a));
        REQUIRE_FALSE(a.valid());
        REQUIRE(b.get() == fd);

        wol::socket c;
        c = std::move(b);
        REQUIRE_FALSE(b.valid());
        REQUIRE(c.get() == fd);
        REQUIRE(is_open(fd));
    }

    SECTION("vector growth keeps descriptors open") {
        std::vector<wol::socket> socks;
        for (int i = 0; i < 8; i++)
            socks.push_back(wol::socket(::socket(AF_INET, SOCK_DGRAM, 0)));
        for (const wol::socket& s : socks)
            REQUIRE(is_open(s.get()));
    }
}
