#include "infrastructure/network/ActivationClient.hpp"

#include "core/protocol/ActivationProtocol.hpp"
#include "infrastructure/network/FramedChannel.hpp"
#include "infrastructure/network/PortProber.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace portlock::infra {

namespace {

std::string currentWorkingDirectory() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        spdlog::debug("Cannot resolve working directory: {}", ec.message());
        return ".";
    }
    return cwd.string();
}

} // namespace

ActivationClient::ActivationClient(std::chrono::milliseconds readTimeout)
    : readTimeout_(readTimeout) {}

core::ActivateStatus ActivationClient::tryActivate(uint16_t port, const std::string& path,
                                                   const std::string& token,
                                                   const std::vector<std::string>& args) const {
    if (PortProber::isPortFree(port)) {
        return core::ActivateStatus::NoInstance;
    }

    FramedChannel channel;
    if (!channel.connect(port, readTimeout_)) {
        return core::ActivateStatus::NoInstance;
    }

    auto count = channel.readCount(readTimeout_);
    if (!count) {
        spdlog::debug("No path list from port {}: {}", port, channel.lastError().message());
        return core::ActivateStatus::NoInstance;
    }

    std::vector<std::string> peerPaths;
    peerPaths.reserve(*count);
    for (uint16_t i = 0; i < *count; ++i) {
        auto peerPath = channel.readString(readTimeout_);
        if (!peerPath) {
            spdlog::debug("Incomplete path list from port {}: {}", port,
                          channel.lastError().message());
            return core::ActivateStatus::NoInstance;
        }
        peerPaths.push_back(std::move(*peerPath));
    }

    if (std::find(peerPaths.begin(), peerPaths.end(), path) == peerPaths.end()) {
        spdlog::debug("Instance on port {} does not own {}", port, path);
        return core::ActivateStatus::NoInstance;
    }

    auto command = core::composeActivationCommand(token, currentWorkingDirectory(), args);
    if (!channel.writeString(command, readTimeout_)) {
        spdlog::info("Cannot send activation request to port {}: {}", port,
                     channel.lastError().message());
        return core::ActivateStatus::CannotActivate;
    }

    auto reply = channel.readString(readTimeout_);
    if (reply && *reply == core::OK_REPLY) {
        spdlog::info("Activated instance on port {} for {}", port, path);
        return core::ActivateStatus::Activated;
    }

    spdlog::info("Instance on port {} did not acknowledge activation: {}", port,
                 reply ? "unexpected reply" : channel.lastError().message());
    return core::ActivateStatus::CannotActivate;
}

} // namespace portlock::infra
