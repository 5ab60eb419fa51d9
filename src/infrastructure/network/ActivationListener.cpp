#include "infrastructure/network/ActivationListener.hpp"

#include "core/protocol/ActivationProtocol.hpp"
#include "infrastructure/network/FramedChannel.hpp"
#include "infrastructure/network/PortProber.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <limits>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace portlock::infra {

namespace {

bool isStopError(const asio::error_code& ec) {
    return ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor;
}

void lowerThreadPriority() {
#ifdef __linux__
    sched_param param{};
    if (int rc = pthread_setschedparam(pthread_self(), SCHED_IDLE, &param); rc != 0) {
        spdlog::debug("Cannot lower activation listener priority: {}", std::strerror(rc));
    }
#endif
}

} // namespace

ActivationListener::ActivationListener(core::IActivationTarget& target,
                                       core::ILockNotifier* notifier,
                                       std::chrono::milliseconds readTimeout)
    : target_(target), notifier_(notifier), readTimeout_(readTimeout) {}

ActivationListener::~ActivationListener() {
    stop();
}

std::string ActivationListener::stateToString(ListenerState state) {
    switch (state) {
    case ListenerState::Idle:
        return "Idle";
    case ListenerState::Accepting:
        return "Accepting";
    case ListenerState::Serving:
        return "Serving";
    case ListenerState::Stopped:
        return "Stopped";
    case ListenerState::Failed:
        return "Failed";
    }
    return "Idle";
}

std::optional<uint16_t> ActivationListener::bind(const core::PortRange& range) {
    if (acceptor_) {
        return std::nullopt;
    }

    acceptor_ = PortProber::bindFirstAvailable(acceptContext_, range);
    if (!acceptor_) {
        return std::nullopt;
    }

    asio::error_code ec;
    port_ = acceptor_->local_endpoint(ec).port();
    return port_;
}

void ActivationListener::start() {
    if (!acceptor_ || worker_.joinable()) {
        return;
    }

    worker_ = std::jthread([this](std::stop_token stopToken) { run(stopToken); });
}

void ActivationListener::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    closeAcceptor();
}

void ActivationListener::run(std::stop_token stopToken) {
    lowerThreadPriority();
    spdlog::debug("Activation listener started on port {}", port_);

    // Closing the acceptor on the loop thread completes the pending accept
    // with operation_aborted, which ends the loop.
    std::stop_callback onStop(stopToken, [this]() {
        asio::post(acceptContext_, [this]() { closeAcceptor(); });
    });

    startAccept(stopToken);

    try {
        acceptContext_.run();
    } catch (const std::exception& e) {
        fail(e.what());
    }

    if (state_.load() != ListenerState::Failed) {
        state_ = ListenerState::Stopped;
    }
    spdlog::debug("Activation listener on port {} finished ({})", port_,
                  stateToString(state_.load()));
}

void ActivationListener::startAccept(std::stop_token stopToken) {
    if (stopToken.stop_requested() || !acceptor_ || !acceptor_->is_open()) {
        return;
    }

    state_ = ListenerState::Accepting;
    auto channel = std::make_shared<FramedChannel>();
    acceptor_->async_accept(channel->socket(),
                            [this, channel, stopToken](const asio::error_code& ec) {
                                onAccept(ec, channel, stopToken);
                            });
}

void ActivationListener::onAccept(const asio::error_code& ec,
                                  const std::shared_ptr<FramedChannel>& channel,
                                  std::stop_token stopToken) {
    if (ec) {
        if (isStopError(ec) || stopToken.stop_requested()) {
            spdlog::debug("Lock socket on port {} closed", port_);
            return;
        }
        spdlog::debug("Accept failed on port {}: {}", port_, ec.message());
        startAccept(stopToken);
        return;
    }

    // Peer I/O failures come back as error codes from the channel; an exception
    // here means the owner is broken, so the loop ends.
    state_ = ListenerState::Serving;
    try {
        serve(*channel);
    } catch (const std::exception& e) {
        channel->close();
        fail(e.what());
        return;
    }
    channel->close();

    startAccept(stopToken);
}

void ActivationListener::serve(FramedChannel& channel) {
    auto peer = channel.remoteDescription();
    auto paths = target_.lockedPaths();
    if (paths.size() > std::numeric_limits<uint16_t>::max()) {
        paths.resize(std::numeric_limits<uint16_t>::max());
    }

    if (!channel.writeCount(static_cast<uint16_t>(paths.size()), readTimeout_)) {
        spdlog::debug("Cannot send path list to {}: {}", peer, channel.lastError().message());
        return;
    }
    for (const auto& path : paths) {
        if (!channel.writeString(path, readTimeout_)) {
            spdlog::debug("Cannot send path list to {}: {}", peer, channel.lastError().message());
            return;
        }
    }

    auto command = channel.readString(readTimeout_);
    if (!command) {
        spdlog::debug("No command from {}: {}", peer, channel.lastError().message());
        return;
    }

    auto fields = core::parseActivationCommand(*command);
    if (!fields) {
        spdlog::debug("Ignoring command of {} bytes from {}", command->size(), peer);
        return;
    }

    if (fields->empty() || !target_.isTokenValid(fields->front())) {
        spdlog::warn("Unauthorized activation request from {}", peer);
        if (notifier_) {
            notifier_->unauthorizedRequest(peer);
        }
        return;
    }

    std::vector<std::string> args(fields->begin() + 1, fields->end());
    spdlog::info("Activation request from {} with {} field(s)", peer, args.size());
    target_.activate(args);

    if (!channel.writeString(core::OK_REPLY, readTimeout_)) {
        spdlog::debug("Cannot acknowledge activation to {}: {}", peer,
                      channel.lastError().message());
    }
}

void ActivationListener::fail(const std::string& reason) {
    state_ = ListenerState::Failed;
    spdlog::critical("Activation listener on port {} failed, other instances can no longer "
                     "reach this one: {}",
                     port_, reason);
    if (notifier_) {
        notifier_->listenerFailed(reason);
    }
    closeAcceptor();
}

void ActivationListener::closeAcceptor() {
    if (acceptor_ && acceptor_->is_open()) {
        asio::error_code ec;
        acceptor_->close(ec);
        if (ec) {
            spdlog::debug("Closing lock socket on port {}: {}", port_, ec.message());
        }
    }
}

} // namespace portlock::infra
