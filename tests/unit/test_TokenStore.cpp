#include <catch2/catch_test_macros.hpp>

#include "infrastructure/crypto/TokenStore.hpp"
#include "support/TestSupport.hpp"

#include <fstream>
#include <regex>
#include <set>
#include <sstream>

using namespace portlock::infra;
using portlock::test::TestDir;

namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

} // namespace

TEST_CASE("Token generation", "[TokenStore]") {
    SECTION("Token is a version 4 UUID") {
        auto token = TokenStore::generateToken();
        std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
        REQUIRE(std::regex_match(token, uuid));
    }

    SECTION("Tokens are unique") {
        std::set<std::string> tokens;
        for (int i = 0; i < 100; ++i) {
            tokens.insert(TokenStore::generateToken());
        }
        REQUIRE(tokens.size() == 100);
    }
}

TEST_CASE("Token file", "[TokenStore]") {
    TestDir dir("portlock_token_test");

    SECTION("Missing token file loads as unknown") {
        REQUIRE(TokenStore::loadToken(dir.path()) == "-");
    }

    SECTION("Written token loads back") {
        REQUIRE(TokenStore::writeToken(dir.path(), "secret-token"));
        REQUIRE(TokenStore::loadToken(dir.path()) == "secret-token");
    }

    SECTION("Writing replaces an existing token") {
        REQUIRE(TokenStore::writeToken(dir.path(), "first"));
        REQUIRE(TokenStore::writeToken(dir.path(), "second"));
        REQUIRE(TokenStore::loadToken(dir.path()) == "second");
    }

#ifndef _WIN32
    SECTION("Token file is readable and writable by the owner only") {
        REQUIRE(TokenStore::writeToken(dir.path(), "secret-token"));

        using std::filesystem::perms;
        auto mode = std::filesystem::status(TokenStore::tokenPath(dir.path())).permissions();
        REQUIRE((mode & perms::all) == (perms::owner_read | perms::owner_write));
    }
#endif

    SECTION("No temporary file is left behind") {
        REQUIRE(TokenStore::writeToken(dir.path(), "secret-token"));

        int entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
            (void)entry;
            ++entries;
        }
        REQUIRE(entries == 1);
    }

    SECTION("Creates the directory if needed") {
        auto nested = dir.path() / "nested" / "config";
        REQUIRE(TokenStore::writeToken(nested, "secret-token"));
        REQUIRE(TokenStore::loadToken(nested) == "secret-token");
    }

    SECTION("Remove deletes the file and tolerates a missing one") {
        REQUIRE(TokenStore::writeToken(dir.path(), "secret-token"));
        TokenStore::removeToken(dir.path());
        REQUIRE_FALSE(std::filesystem::exists(TokenStore::tokenPath(dir.path())));
        REQUIRE_NOTHROW(TokenStore::removeToken(dir.path()));
    }
}

TEST_CASE("Port marker file", "[TokenStore]") {
    TestDir dir("portlock_port_marker_test");

    SECTION("Contains the decimal port") {
        REQUIRE(TokenStore::writePortMarker(dir.path(), 6942));
        REQUIRE(readFile(TokenStore::portPath(dir.path())) == "6942");
    }

    SECTION("Is overwritten on the next write") {
        REQUIRE(TokenStore::writePortMarker(dir.path(), 6991));
        REQUIRE(TokenStore::writePortMarker(dir.path(), 6943));
        REQUIRE(readFile(TokenStore::portPath(dir.path())) == "6943");
    }
}
