#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace portlock::infra {

/**
 * @brief Generates the instance token and manages the "token" and "port" marker files.
 *
 * The token file lets a second process read the secret of the running
 * instance, so it is only ever created with owner read/write permissions.
 */
class TokenStore {
public:
    static constexpr const char* TOKEN_FILE_NAME = "token";
    static constexpr const char* PORT_FILE_NAME = "port";
    static constexpr const char* UNKNOWN_TOKEN = "-";

    /**
     * @brief Generates a random token using libsodium.
     * @return 128 random bits formatted as a version 4 UUID.
     * @throws std::runtime_error if libsodium cannot be initialized.
     */
    static std::string generateToken();

    /**
     * @brief Loads the token written by a running instance.
     * @param dir Directory containing the token file.
     * @return File contents, or "-" if the file is missing or unreadable.
     */
    static std::string loadToken(const std::filesystem::path& dir);

    /**
     * @brief Writes the token file atomically with owner-only permissions.
     *
     * The data goes to a temporary file that is created with mode 0600 and then
     * renamed over the token file, so the token is never readable by others.
     *
     * @param dir Directory for the token file.
     * @param token Token to write.
     * @return True if the file was written.
     */
    static bool writeToken(const std::filesystem::path& dir, const std::string& token);

    /**
     * @brief Removes the token file, ignoring errors.
     * @param dir Directory containing the token file.
     */
    static void removeToken(const std::filesystem::path& dir);

    /**
     * @brief Writes the decimal port number to dir/port.
     * @param dir Directory for the port file.
     * @param port Port to write.
     * @return True if written; a partially written file is removed.
     */
    static bool writePortMarker(const std::filesystem::path& dir, uint16_t port);

    static std::filesystem::path tokenPath(const std::filesystem::path& dir) {
        return dir / TOKEN_FILE_NAME;
    }

    static std::filesystem::path portPath(const std::filesystem::path& dir) {
        return dir / PORT_FILE_NAME;
    }
};

} // namespace portlock::infra
