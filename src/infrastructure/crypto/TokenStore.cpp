#include "infrastructure/crypto/TokenStore.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <sstream>
#include <stdexcept>

#ifndef _WIN32
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace portlock::infra {

namespace {

constexpr size_t TOKEN_BYTES = 16;

bool writeFile(const std::filesystem::path& path, const std::string& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file << data;
    file.flush();
    return static_cast<bool>(file);
}

#ifndef _WIN32
bool writeOwnerOnly(const std::filesystem::path& path, const std::string& data) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        spdlog::debug("Cannot create {}: {}", path.string(), std::strerror(errno));
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        auto n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::debug("Cannot write {}: {}", path.string(), std::strerror(errno));
            ::close(fd);
            return false;
        }
        written += static_cast<size_t>(n);
    }

    bool synced = ::fsync(fd) == 0;
    return ::close(fd) == 0 && synced;
}
#endif

} // namespace

std::string TokenStore::generateToken() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    std::array<unsigned char, TOKEN_BYTES> bytes{};
    randombytes_buf(bytes.data(), bytes.size());

    // RFC 4122 version 4, variant 1
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::array<char, TOKEN_BYTES * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());

    std::string digits(hex.data(), TOKEN_BYTES * 2);
    return digits.substr(0, 8) + "-" + digits.substr(8, 4) + "-" + digits.substr(12, 4) + "-" +
           digits.substr(16, 4) + "-" + digits.substr(20, 12);
}

std::string TokenStore::loadToken(const std::filesystem::path& dir) {
    auto path = tokenPath(dir);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return UNKNOWN_TOKEN;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::debug("Cannot read token file {}", path.string());
        return UNKNOWN_TOKEN;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

bool TokenStore::writeToken(const std::filesystem::path& dir, const std::string& token) {
    auto path = tokenPath(dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);

#ifndef _WIN32
    auto temp = dir / (std::string(".") + TOKEN_FILE_NAME + "." + std::to_string(::getpid()));
    std::filesystem::remove(temp, ec);

    if (!writeOwnerOnly(temp, token)) {
        std::filesystem::remove(temp, ec);
        spdlog::warn("Failed to write token file {}", path.string());
        return false;
    }

    std::filesystem::rename(temp, path, ec);
    if (ec) {
        spdlog::warn("Failed to replace token file {}: {}", path.string(), ec.message());
        std::filesystem::remove(temp, ec);
        return false;
    }
#else
    if (!writeFile(path, token)) {
        std::filesystem::remove(path, ec);
        spdlog::warn("Failed to write token file {}", path.string());
        return false;
    }
#endif

    spdlog::debug("Wrote token file {}", path.string());
    return true;
}

void TokenStore::removeToken(const std::filesystem::path& dir) {
    std::error_code ec;
    if (std::filesystem::remove(tokenPath(dir), ec)) {
        spdlog::debug("Removed token file {}", tokenPath(dir).string());
    }
}

bool TokenStore::writePortMarker(const std::filesystem::path& dir, uint16_t port) {
    auto path = portPath(dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);

    if (!writeFile(path, std::to_string(port))) {
        spdlog::warn("Failed to write port marker {}", path.string());
        std::filesystem::remove(path, ec);
        return false;
    }
    return true;
}

} // namespace portlock::infra
