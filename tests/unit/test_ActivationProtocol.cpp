#include <catch2/catch_test_macros.hpp>

#include "core/protocol/ActivationProtocol.hpp"

using namespace portlock::core;
using namespace std::string_literals;

TEST_CASE("Frame headers", "[ActivationProtocol]") {
    SECTION("Headers are big-endian") {
        auto header = encodeHeader(0x1234);
        REQUIRE(header[0] == 0x12);
        REQUIRE(header[1] == 0x34);
        REQUIRE(decodeHeader(header) == 0x1234);
    }

    SECTION("Frame is header followed by payload") {
        auto frame = encodeFrame("ok");
        REQUIRE(frame.has_value());
        REQUIRE(*frame == "\x00\x02ok"s);
    }

    SECTION("Empty payload gives a bare header") {
        auto frame = encodeFrame("");
        REQUIRE(frame == "\x00\x00"s);
    }

    SECTION("Payload above 65535 bytes cannot be framed") {
        REQUIRE(encodeFrame(std::string(MAX_FRAME_BYTES, 'a')).has_value());
        REQUIRE_FALSE(encodeFrame(std::string(MAX_FRAME_BYTES + 1, 'a')).has_value());
    }
}

TEST_CASE("UTF-8 validation", "[ActivationProtocol]") {
    SECTION("Accepts ASCII and multi-byte text") {
        REQUIRE(isValidUtf8(""));
        REQUIRE(isValidUtf8("/home/u/proj"));
        REQUIRE(isValidUtf8("/home/\xC3\xBC/\xE6\x97\xA5\xE6\x9C\xAC/\xF0\x9F\x98\x80"));
    }

    SECTION("Rejects malformed sequences") {
        REQUIRE_FALSE(isValidUtf8("\xFF"));
        REQUIRE_FALSE(isValidUtf8("\xC3"));             // truncated
        REQUIRE_FALSE(isValidUtf8("\xC0\xAF"));         // overlong
        REQUIRE_FALSE(isValidUtf8("\xED\xA0\x80"));     // surrogate
        REQUIRE_FALSE(isValidUtf8("\xF4\x90\x80\x80")); // above U+10FFFF
        REQUIRE_FALSE(isValidUtf8("a\x80z"));
    }

    SECTION("Length counts code points") {
        REQUIRE(utf8Length("abc") == 3);
        REQUIRE(utf8Length("\xC3\xBC\xE6\x97\xA5") == 2);
    }
}

TEST_CASE("Activation command composition", "[ActivationProtocol]") {
    SECTION("Joins token, working directory and arguments with NUL") {
        auto command = composeActivationCommand("tok", "/cwd/B", {"arg1", "arg2"});
        REQUIRE(command == "activate tok\0/cwd/B\0arg1\0arg2"s);
    }

    SECTION("Working directory is followed by a separator without arguments") {
        auto command = composeActivationCommand("tok", "/cwd", {});
        REQUIRE(command == "activate tok\0/cwd\0"s);
    }
}

TEST_CASE("Activation command parsing", "[ActivationProtocol]") {
    SECTION("Returns token, working directory and arguments") {
        auto fields = parseActivationCommand("activate tok\0/cwd/B\0arg1"s);
        REQUIRE(fields.has_value());
        REQUIRE(*fields == std::vector<std::string>{"tok", "/cwd/B", "arg1"});
    }

    SECTION("Drops empty fields") {
        auto fields = parseActivationCommand("activate tok\0/cwd\0"s);
        REQUIRE(fields.has_value());
        REQUIRE(*fields == std::vector<std::string>{"tok", "/cwd"});

        auto bare = parseActivationCommand("activate ");
        REQUIRE(bare.has_value());
        REQUIRE(bare->empty());
    }

    SECTION("Rejects commands without the prefix") {
        REQUIRE_FALSE(parseActivationCommand("").has_value());
        REQUIRE_FALSE(parseActivationCommand("activate").has_value());
        REQUIRE_FALSE(parseActivationCommand("open tok\0/cwd"s).has_value());
        REQUIRE_FALSE(parseActivationCommand(" activate tok").has_value());
    }

    SECTION("Accepts exactly 8192 characters and rejects more") {
        std::string prefix(ACTIVATE_COMMAND);
        std::string atLimit = prefix + std::string(MAX_COMMAND_LENGTH - prefix.size(), 'x');
        std::string overLimit = atLimit + "x";

        REQUIRE(parseActivationCommand(atLimit).has_value());
        REQUIRE_FALSE(parseActivationCommand(overLimit).has_value());
    }

    SECTION("Length limit counts characters, not bytes") {
        std::string prefix(ACTIVATE_COMMAND);
        std::string command = prefix;
        for (size_t i = prefix.size(); i < MAX_COMMAND_LENGTH; ++i) {
            command += "\xC3\xBC";
        }

        REQUIRE(command.size() > MAX_COMMAND_LENGTH);
        REQUIRE(parseActivationCommand(command).has_value());
    }
}
