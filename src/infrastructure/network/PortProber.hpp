#pragma once

#include "core/types/CandidatePorts.hpp"

#include <asio.hpp>
#include <cstdint>
#include <optional>

namespace portlock::infra {

/**
 * @brief Binds loopback listening sockets inside the candidate port range.
 *
 * Binding is also how the prober tells whether a port is in use: a failed
 * bind on 127.0.0.1 means some process is already listening there.
 */
class PortProber {
public:
    /**
     * @brief Backlog passed to listen() for lock sockets.
     */
    static constexpr int LISTEN_BACKLOG = 50;

    /**
     * @brief Binds and listens on 127.0.0.1:port.
     * @param context Context the acceptor will run on.
     * @param port Port to bind.
     * @param ec Set to the bind error on failure.
     * @return The listening acceptor, or nullopt if the port could not be bound.
     */
    static std::optional<asio::ip::tcp::acceptor> tryBind(asio::io_context& context, uint16_t port,
                                                          asio::error_code& ec);

    /**
     * @brief Binds the first available port of the range in ascending order.
     *
     * Forbidden ports are skipped. Each failed port is logged.
     *
     * @param context Context the acceptor will run on.
     * @param range Candidate range to scan.
     * @return The listening acceptor, or nullopt if every port is taken.
     */
    static std::optional<asio::ip::tcp::acceptor>
    bindFirstAvailable(asio::io_context& context, const core::PortRange& range);

    /**
     * @brief Checks whether nothing listens on 127.0.0.1:port.
     *
     * Binds a throwaway socket and releases it at once.
     *
     * @param port Port to check.
     * @return True if the bind succeeded.
     */
    static bool isPortFree(uint16_t port);
};

} // namespace portlock::infra
