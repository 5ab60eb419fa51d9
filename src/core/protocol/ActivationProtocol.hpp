/**
 * @file ActivationProtocol.hpp
 * @brief Wire format shared by the activation client and the listener.
 *
 * Every message is one frame: a 2-byte big-endian byte length followed by
 * that many UTF-8 bytes. On connect the listener sends a 2-byte big-endian
 * path count followed by that many path frames; the client answers with one
 * command frame and the listener replies with the frame "ok" or closes the
 * connection without replying.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portlock::core {

inline constexpr std::string_view ACTIVATE_COMMAND = "activate "; ///< Command prefix
inline constexpr std::string_view OK_REPLY = "ok";                ///< Success reply
inline constexpr char FIELD_SEPARATOR = '\0';                      ///< Separates command fields

constexpr size_t MAX_COMMAND_LENGTH = 8192; ///< Longest accepted command, in code points
constexpr size_t MAX_FRAME_BYTES = 65535;   ///< Largest payload a frame header can describe
constexpr size_t FRAME_HEADER_SIZE = 2;     ///< Size of a frame or count header in bytes

using FrameHeader = std::array<unsigned char, FRAME_HEADER_SIZE>;

/**
 * @brief Encodes a 16-bit value as a big-endian header.
 * @param value Frame length or path count.
 * @return The two header bytes.
 */
[[nodiscard]] FrameHeader encodeHeader(uint16_t value);

/**
 * @brief Decodes a big-endian header.
 * @param header The two header bytes.
 * @return Frame length or path count.
 */
[[nodiscard]] uint16_t decodeHeader(const FrameHeader& header);

/**
 * @brief Builds a complete frame (header + payload).
 * @param payload UTF-8 payload.
 * @return The frame bytes, or nullopt if the payload exceeds MAX_FRAME_BYTES.
 */
[[nodiscard]] std::optional<std::string> encodeFrame(std::string_view payload);

/**
 * @brief Checks that a byte sequence is well-formed UTF-8.
 *
 * Rejects overlong encodings, surrogates and code points above U+10FFFF.
 */
[[nodiscard]] bool isValidUtf8(std::string_view text);

/**
 * @brief Counts the code points of a well-formed UTF-8 string.
 */
[[nodiscard]] size_t utf8Length(std::string_view text);

/**
 * @brief Builds an activation command.
 * @param token Secret token of the instance being activated.
 * @param workingDirectory Absolute working directory of the requesting process.
 * @param args Extra command-line arguments of the requesting process.
 * @return "activate " + token + NUL + workingDirectory + NUL + NUL-joined args.
 */
[[nodiscard]] std::string composeActivationCommand(const std::string& token,
                                                   const std::string& workingDirectory,
                                                   const std::vector<std::string>& args);

/**
 * @brief Splits an activation command into its fields.
 *
 * Empty fields are dropped, so a command without extra arguments and one with
 * a trailing separator parse the same way.
 *
 * @param command The received command string.
 * @return Token followed by working directory and arguments, or nullopt if the
 *         command lacks the prefix or is longer than MAX_COMMAND_LENGTH.
 */
[[nodiscard]] std::optional<std::vector<std::string>>
parseActivationCommand(const std::string& command);

} // namespace portlock::core
