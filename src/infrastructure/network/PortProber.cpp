#include "infrastructure/network/PortProber.hpp"

#include <spdlog/spdlog.h>

namespace portlock::infra {

std::optional<asio::ip::tcp::acceptor> PortProber::tryBind(asio::io_context& context, uint16_t port,
                                                           asio::error_code& ec) {
    asio::ip::tcp::endpoint endpoint(asio::ip::address_v4::loopback(), port);
    asio::ip::tcp::acceptor acceptor(context);

    acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        return std::nullopt;
    }

#ifdef _WIN32
    // SO_REUSEADDR on Windows would let a second process bind over a live listener
    using exclusive_address_use =
        asio::detail::socket_option::boolean<SOL_SOCKET, SO_EXCLUSIVEADDRUSE>;
    acceptor.set_option(exclusive_address_use(true), ec);
#else
    // Allows rebinding over TIME_WAIT, never over a listener
    acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
#endif
    if (!ec) {
        acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor.listen(LISTEN_BACKLOG, ec);
    }
    if (ec) {
        asio::error_code ignored;
        acceptor.close(ignored);
        return std::nullopt;
    }

    return acceptor;
}

std::optional<asio::ip::tcp::acceptor>
PortProber::bindFirstAvailable(asio::io_context& context, const core::PortRange& range) {
    for (uint16_t port : range.candidates()) {
        asio::error_code ec;
        auto acceptor = tryBind(context, port, ec);
        if (acceptor) {
            spdlog::debug("Bound lock socket on 127.0.0.1:{}", port);
            return acceptor;
        }
        spdlog::info("Port {} is not available: {}", port, ec.message());
    }
    return std::nullopt;
}

bool PortProber::isPortFree(uint16_t port) {
    asio::io_context context;
    asio::error_code ec;
    auto acceptor = tryBind(context, port, ec);
    if (!acceptor) {
        return false;
    }
    acceptor->close(ec);
    return true;
}

} // namespace portlock::infra
