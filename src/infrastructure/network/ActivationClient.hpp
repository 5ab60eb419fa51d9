#pragma once

#include "core/types/ActivateStatus.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace portlock::infra {

/**
 * @brief Asks a sibling instance listening on a candidate port to activate.
 *
 * The client first checks whether anything listens on the port. If so, it
 * reads the peer's locked paths and, when the requested path is among them,
 * sends an activation command and waits for the "ok" reply.
 */
class ActivationClient {
public:
    /**
     * @brief Constructs a client.
     * @param readTimeout Deadline for each read from the peer.
     */
    explicit ActivationClient(std::chrono::milliseconds readTimeout = std::chrono::milliseconds(300));

    /**
     * @brief Probes one port and activates the instance there if it owns the path.
     * @param port Candidate port to probe.
     * @param path Path the instance must have locked.
     * @param token Secret token of the instance, "-" when unknown.
     * @param args Extra arguments forwarded after the working directory.
     * @return NoInstance if nothing relevant listens on the port, Activated if the
     *         instance acknowledged, CannotActivate if it owns the path but the
     *         handshake failed.
     */
    core::ActivateStatus tryActivate(uint16_t port, const std::string& path, const std::string& token,
                                     const std::vector<std::string>& args) const;

private:
    std::chrono::milliseconds readTimeout_;
};

} // namespace portlock::infra
