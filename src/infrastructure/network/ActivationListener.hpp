#pragma once

#include "core/services/IActivationTarget.hpp"
#include "core/services/ILockNotifier.hpp"
#include "core/types/CandidatePorts.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace portlock::infra {

class FramedChannel;

/**
 * @brief Lifecycle of the listener's accept loop.
 */
enum class ListenerState : int {
    Idle = 0,      ///< Bound or not yet bound, loop not started
    Accepting = 1, ///< Waiting for a peer to connect
    Serving = 2,   ///< Exchanging the protocol with one peer
    Stopped = 3,   ///< Lock socket closed, loop ended
    Failed = 4     ///< Loop ended on an unexpected error
};

/**
 * @brief Serves activation requests on the lock socket.
 *
 * Owns the lock socket and a dedicated worker thread running the accept loop.
 * Connections are served one at a time: the locked paths are sent, one
 * command is read and, if it carries the right token, forwarded to the target
 * and acknowledged with "ok".
 *
 * I/O errors on a connection or from accept() only end that connection.
 * stop() closes the lock socket on the loop's own thread, which is the only
 * normal way for the loop to end. Any other exception is fatal: the loop ends,
 * the state becomes Failed and the notifier is told.
 *
 * @note This class is non-copyable.
 */
class ActivationListener {
public:
    /**
     * @brief Constructs a listener.
     * @param target State served to peers.
     * @param notifier Receives security warnings and fatal errors, may be null.
     * @param readTimeout Deadline for each read and write on a connection.
     */
    ActivationListener(core::IActivationTarget& target, core::ILockNotifier* notifier,
                       std::chrono::milliseconds readTimeout = std::chrono::milliseconds(800));

    /**
     * @brief Destructor. Stops the loop and closes the lock socket.
     */
    ~ActivationListener();

    ActivationListener(const ActivationListener&) = delete;
    ActivationListener& operator=(const ActivationListener&) = delete;

    /**
     * @brief Binds the lock socket to the first available candidate port.
     * @param range Candidate port range.
     * @return The bound port, or nullopt if no port could be bound.
     */
    std::optional<uint16_t> bind(const core::PortRange& range);

    /**
     * @brief Starts the accept loop on the worker thread.
     *
     * Has no effect if the socket is not bound or the loop already started.
     */
    void start();

    /**
     * @brief Closes the lock socket and joins the worker thread.
     *
     * Safe to call more than once.
     */
    void stop();

    /**
     * @brief Returns the bound port, 0 before bind().
     */
    uint16_t port() const { return port_; }

    ListenerState state() const { return state_.load(); }

    static std::string stateToString(ListenerState state);

private:
    void run(std::stop_token stopToken);
    void startAccept(std::stop_token stopToken);
    void onAccept(const asio::error_code& ec, const std::shared_ptr<FramedChannel>& channel,
                  std::stop_token stopToken);
    void serve(FramedChannel& channel);
    void fail(const std::string& reason);
    void closeAcceptor();

    core::IActivationTarget& target_;
    core::ILockNotifier* notifier_;
    std::chrono::milliseconds readTimeout_;

    asio::io_context acceptContext_;
    std::optional<asio::ip::tcp::acceptor> acceptor_;
    uint16_t port_{0};
    std::atomic<ListenerState> state_{ListenerState::Idle};
    std::jthread worker_;
};

} // namespace portlock::infra
