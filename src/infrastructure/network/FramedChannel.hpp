#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace portlock::infra {

/**
 * @brief A loopback TCP connection exchanging length-prefixed UTF-8 frames.
 *
 * Each channel runs its own asio::io_context on the calling thread. Every
 * operation is started asynchronously and the context is run until the
 * operation completes or its deadline passes; an expired deadline closes the
 * socket, so a timed-out channel cannot be used any further.
 *
 * Failures are returned as empty optionals or false and the error is kept in
 * lastError(); nothing here throws for I/O errors.
 *
 * @note This class is non-copyable.
 */
class FramedChannel {
public:
    FramedChannel();

    /**
     * @brief Destructor. Closes the socket.
     */
    ~FramedChannel();

    FramedChannel(const FramedChannel&) = delete;
    FramedChannel& operator=(const FramedChannel&) = delete;


    /**
     * @brief Returns the underlying socket.
     */
    asio::ip::tcp::socket& socket() { return socket_; }

    /**
     * @brief Connects to 127.0.0.1 on the given port.
     * @param port Port to connect to.
     * @param timeout Maximum time to wait for the connection.
     * @return True if connected.
     */
    bool connect(uint16_t port, std::chrono::milliseconds timeout);

    /**
     * @brief Reads one frame.
     * @param timeout Maximum time to wait for the whole frame.
     * @return The payload, or nullopt on I/O error, timeout or invalid UTF-8.
     */
    std::optional<std::string> readString(std::chrono::milliseconds timeout);

    /**
     * @brief Writes one frame.
     * @param value UTF-8 payload, at most 65535 bytes.
     * @param timeout Maximum time to wait for the write.
     * @return True if the whole frame was written.
     */
    bool writeString(std::string_view value, std::chrono::milliseconds timeout);

    /**
     * @brief Reads a 2-byte count header.
     * @param timeout Maximum time to wait.
     * @return The count, or nullopt on I/O error or timeout.
     */
    std::optional<uint16_t> readCount(std::chrono::milliseconds timeout);

    /**
     * @brief Writes a 2-byte count header.
     * @param count Value to write.
     * @param timeout Maximum time to wait for the write.
     * @return True if written.
     */
    bool writeCount(uint16_t count, std::chrono::milliseconds timeout);

    /**
     * @brief Closes the socket. Safe to call more than once.
     */
    void close();

    bool isOpen() const { return socket_.is_open(); }

    /**
     * @brief Describes the remote endpoint for log messages.
     * @return "address:port", or "unknown" if the socket is not connected.
     */
    std::string remoteDescription() const;

    /**
     * @brief Returns the error of the last failed operation.
     *
     * asio::error::timed_out after a deadline expired, asio::error::invalid_argument
     * after a malformed frame.
     */
    const asio::error_code& lastError() const { return lastError_; }

    bool timedOut() const { return lastError_ == asio::error::timed_out; }

private:
    using Deadline = std::chrono::steady_clock::time_point;

    template <typename Operation>
    bool complete(Operation&& start, Deadline deadline);

    bool readExactly(void* data, size_t size, Deadline deadline);
    bool writeAll(const std::string& bytes, Deadline deadline);

    asio::io_context context_;
    asio::ip::tcp::socket socket_;
    asio::error_code lastError_;
};

} // namespace portlock::infra
