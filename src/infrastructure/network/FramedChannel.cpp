#include "infrastructure/network/FramedChannel.hpp"

#include "core/protocol/ActivationProtocol.hpp"

#include <spdlog/spdlog.h>

namespace portlock::infra {

FramedChannel::FramedChannel() : socket_(context_) {}

FramedChannel::~FramedChannel() {
    close();
}

template <typename Operation>
bool FramedChannel::complete(Operation&& start, Deadline deadline) {
    asio::error_code result = asio::error::would_block;
    start([&result](const asio::error_code& ec, auto&&...) { result = ec; });

    auto now = std::chrono::steady_clock::now();
    auto remaining = deadline > now ? deadline - now : std::chrono::steady_clock::duration::zero();

    context_.restart();
    context_.run_for(remaining);

    if (!context_.stopped()) {
        // Deadline expired with the operation still pending
        asio::error_code ignored;
        socket_.close(ignored);
        context_.run();
        lastError_ = asio::error::timed_out;
        return false;
    }

    if (result) {
        lastError_ = result;
        return false;
    }
    return true;
}

bool FramedChannel::connect(uint16_t port, std::chrono::milliseconds timeout) {
    asio::ip::tcp::endpoint endpoint(asio::ip::address_v4::loopback(), port);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    bool connected = complete(
        [this, &endpoint](auto handler) { socket_.async_connect(endpoint, std::move(handler)); },
        deadline);
    if (!connected) {
        spdlog::debug("Connect to 127.0.0.1:{} failed: {}", port, lastError_.message());
    }
    return connected;
}

bool FramedChannel::readExactly(void* data, size_t size, Deadline deadline) {
    if (size == 0) {
        return true;
    }
    return complete(
        [this, data, size](auto handler) {
            asio::async_read(socket_, asio::buffer(data, size), std::move(handler));
        },
        deadline);
}

bool FramedChannel::writeAll(const std::string& bytes, Deadline deadline) {
    return complete(
        [this, &bytes](auto handler) {
            asio::async_write(socket_, asio::buffer(bytes), std::move(handler));
        },
        deadline);
}

std::optional<std::string> FramedChannel::readString(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    core::FrameHeader header{};
    if (!readExactly(header.data(), header.size(), deadline)) {
        return std::nullopt;
    }

    std::string payload(core::decodeHeader(header), '\0');
    if (!readExactly(payload.data(), payload.size(), deadline)) {
        return std::nullopt;
    }

    if (!core::isValidUtf8(payload)) {
        spdlog::debug("Malformed UTF-8 frame from {}", remoteDescription());
        lastError_ = asio::error::invalid_argument;
        return std::nullopt;
    }
    return payload;
}

bool FramedChannel::writeString(std::string_view value, std::chrono::milliseconds timeout) {
    auto frame = core::encodeFrame(value);
    if (!frame) {
        spdlog::debug("Frame of {} bytes exceeds the protocol limit", value.size());
        lastError_ = asio::error::message_size;
        return false;
    }
    return writeAll(*frame, std::chrono::steady_clock::now() + timeout);
}

std::optional<uint16_t> FramedChannel::readCount(std::chrono::milliseconds timeout) {
    core::FrameHeader header{};
    if (!readExactly(header.data(), header.size(), std::chrono::steady_clock::now() + timeout)) {
        return std::nullopt;
    }
    return core::decodeHeader(header);
}

bool FramedChannel::writeCount(uint16_t count, std::chrono::milliseconds timeout) {
    auto header = core::encodeHeader(count);
    std::string bytes(header.begin(), header.end());
    return writeAll(bytes, std::chrono::steady_clock::now() + timeout);
}

void FramedChannel::close() {
    if (!socket_.is_open()) {
        return;
    }
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

std::string FramedChannel::remoteDescription() const {
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace portlock::infra
