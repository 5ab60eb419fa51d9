#include <catch2/catch_test_macros.hpp>

#include "core/types/ActivateStatus.hpp"

using namespace portlock::core;

TEST_CASE("ActivateStatus string conversion", "[ActivateStatus]") {
    SECTION("Converts each status to its name") {
        REQUIRE(activateStatusToString(ActivateStatus::Activated) == "Activated");
        REQUIRE(activateStatusToString(ActivateStatus::NoInstance) == "NoInstance");
        REQUIRE(activateStatusToString(ActivateStatus::CannotActivate) == "CannotActivate");
    }

    SECTION("Parses names back") {
        REQUIRE(activateStatusFromString("Activated") == ActivateStatus::Activated);
        REQUIRE(activateStatusFromString("NoInstance") == ActivateStatus::NoInstance);
        REQUIRE(activateStatusFromString("CannotActivate") == ActivateStatus::CannotActivate);
    }

    SECTION("Unknown names parse as NoInstance") {
        REQUIRE(activateStatusFromString("") == ActivateStatus::NoInstance);
        REQUIRE(activateStatusFromString("activated") == ActivateStatus::NoInstance);
    }
}
