#pragma once

#include "core/protocol/ActivationProtocol.hpp"
#include "infrastructure/network/PortProber.hpp"

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace portlock::test {

/**
 * @brief Accepts one connection on 127.0.0.1 and runs a script on it.
 *
 * The script uses blocking asio calls on the accepted socket. The server
 * gives up if nobody connects within five seconds.
 */
class ScriptedServer {
public:
    using Script = std::function<void(asio::ip::tcp::socket&)>;

    ScriptedServer(uint16_t port, Script script) : socket_(context_), script_(std::move(script)) {
        asio::error_code ec;
        acceptor_ = infra::PortProber::tryBind(context_, port, ec);
        if (!acceptor_) {
            return;
        }

        thread_ = std::thread([this]() {
            acceptor_->async_accept(socket_, [this](const asio::error_code& ec) {
                if (!ec) {
                    accepted_ = true;
                    script_(socket_);
                }
            });
            context_.run_for(std::chrono::seconds(5));
        });
    }

    ~ScriptedServer() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    ScriptedServer(const ScriptedServer&) = delete;
    ScriptedServer& operator=(const ScriptedServer&) = delete;

    bool isListening() const { return acceptor_.has_value(); }

    /**
     * @brief Waits for the script to finish.
     * @return True if a connection was accepted.
     */
    bool join() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return accepted_;
    }

    static void writeFrame(asio::ip::tcp::socket& socket, const std::string& payload) {
        auto frame = core::encodeFrame(payload);
        asio::error_code ec;
        asio::write(socket, asio::buffer(*frame), ec);
    }

    static void writeCount(asio::ip::tcp::socket& socket, uint16_t count) {
        auto header = core::encodeHeader(count);
        asio::error_code ec;
        asio::write(socket, asio::buffer(header), ec);
    }

    static std::optional<std::string> readFrame(asio::ip::tcp::socket& socket) {
        core::FrameHeader header{};
        asio::error_code ec;
        asio::read(socket, asio::buffer(header), ec);
        if (ec) {
            return std::nullopt;
        }
        std::string payload(core::decodeHeader(header), '\0');
        asio::read(socket, asio::buffer(payload), ec);
        if (ec) {
            return std::nullopt;
        }
        return payload;
    }

private:
    asio::io_context context_;
    std::optional<asio::ip::tcp::acceptor> acceptor_;
    asio::ip::tcp::socket socket_;
    Script script_;
    bool accepted_{false};
    std::thread thread_;
};

} // namespace portlock::test
