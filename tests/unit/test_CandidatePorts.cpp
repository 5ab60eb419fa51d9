#include <catch2/catch_test_macros.hpp>

#include "core/types/CandidatePorts.hpp"

#include <algorithm>

using namespace portlock::core;

TEST_CASE("Forbidden ports", "[CandidatePorts]") {
    SECTION("Deny-list ports are forbidden") {
        REQUIRE(isPortForbidden(6953));
        REQUIRE(isPortForbidden(6969));
        REQUIRE(isPortForbidden(6970));
    }

    SECTION("Neighbouring ports are allowed") {
        REQUIRE_FALSE(isPortForbidden(6942));
        REQUIRE_FALSE(isPortForbidden(6952));
        REQUIRE_FALSE(isPortForbidden(6954));
        REQUIRE_FALSE(isPortForbidden(6971));
    }
}

TEST_CASE("Default candidate range", "[CandidatePorts]") {
    PortRange range;

    SECTION("Starts at 6942 and spans 50 ports") {
        REQUIRE(range.first == 6942);
        REQUIRE(range.size == 50);
        REQUIRE(range.contains(6942));
        REQUIRE(range.contains(6991));
        REQUIRE_FALSE(range.contains(6941));
        REQUIRE_FALSE(range.contains(6992));
    }

    SECTION("Candidates exclude every forbidden port") {
        auto ports = range.candidates();

        REQUIRE(ports.size() == 47);
        for (auto forbidden : FORBIDDEN_PORTS) {
            REQUIRE(std::find(ports.begin(), ports.end(), forbidden) == ports.end());
        }
    }

    SECTION("Candidates are ascending and inside the range") {
        auto ports = range.candidates();

        REQUIRE(ports.front() == 6942);
        REQUIRE(ports.back() == 6991);
        REQUIRE(std::is_sorted(ports.begin(), ports.end()));
        REQUIRE(std::all_of(ports.begin(), ports.end(), [&](uint16_t p) { return range.contains(p); }));
    }
}

TEST_CASE("Custom candidate range", "[CandidatePorts]") {
    SECTION("Range without forbidden ports keeps every port") {
        PortRange range{23000, 4};
        REQUIRE(range.candidates() == std::vector<uint16_t>{23000, 23001, 23002, 23003});
    }

    SECTION("Forbidden ports are skipped in any range") {
        PortRange range{6968, 4};
        REQUIRE(range.candidates() == std::vector<uint16_t>{6968, 6971});
    }

    SECTION("Range is clipped at the last valid port") {
        PortRange range{65534, 10};
        REQUIRE(range.candidates() == std::vector<uint16_t>{65534, 65535});
    }
}
