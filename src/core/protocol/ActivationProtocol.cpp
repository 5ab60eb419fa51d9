#include "core/protocol/ActivationProtocol.hpp"

namespace portlock::core {

FrameHeader encodeHeader(uint16_t value) {
    return {static_cast<unsigned char>((value >> 8) & 0xFF),
            static_cast<unsigned char>(value & 0xFF)};
}

uint16_t decodeHeader(const FrameHeader& header) {
    return static_cast<uint16_t>((static_cast<uint16_t>(header[0]) << 8) | header[1]);
}

std::optional<std::string> encodeFrame(std::string_view payload) {
    if (payload.size() > MAX_FRAME_BYTES) {
        return std::nullopt;
    }

    auto header = encodeHeader(static_cast<uint16_t>(payload.size()));
    std::string frame;
    frame.reserve(FRAME_HEADER_SIZE + payload.size());
    frame.push_back(static_cast<char>(header[0]));
    frame.push_back(static_cast<char>(header[1]));
    frame.append(payload);
    return frame;
}

bool isValidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t codePoint = 0;
        uint32_t minimum = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codePoint = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codePoint = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codePoint = lead & 0x07;
            minimum = 0x10000;
        } else {
            return false;
        }

        if (i + extra >= text.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (cont & 0x3F);
        }

        if (codePoint < minimum || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

size_t utf8Length(std::string_view text) {
    size_t count = 0;
    for (char c : text) {
        // Count every byte that is not a continuation byte
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string composeActivationCommand(const std::string& token,
                                     const std::string& workingDirectory,
                                     const std::vector<std::string>& args) {
    std::string command(ACTIVATE_COMMAND);
    command += token;
    command += FIELD_SEPARATOR;
    command += workingDirectory;
    command += FIELD_SEPARATOR;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            command += FIELD_SEPARATOR;
        }
        command += args[i];
    }
    return command;
}

std::optional<std::vector<std::string>> parseActivationCommand(const std::string& command) {
    if (command.compare(0, ACTIVATE_COMMAND.size(), ACTIVATE_COMMAND) != 0) {
        return std::nullopt;
    }
    if (utf8Length(command) > MAX_COMMAND_LENGTH) {
        return std::nullopt;
    }

    std::vector<std::string> fields;
    size_t start = ACTIVATE_COMMAND.size();
    while (start <= command.size()) {
        auto end = command.find(FIELD_SEPARATOR, start);
        if (end == std::string::npos) {
            end = command.size();
        }
        if (end > start) {
            fields.push_back(command.substr(start, end - start));
        }
        start = end + 1;
    }
    return fields;
}

} // namespace portlock::core
