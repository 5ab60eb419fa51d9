/**
 * @file CandidatePorts.hpp
 * @brief Candidate port range and deny-list used for the instance lock socket.
 *
 * Every port that is bound as a lock socket or probed for a sibling instance
 * comes from this range and is never one of the forbidden ports.
 */

#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace portlock::core {

constexpr uint16_t PORT_RANGE_START = 6942; ///< First port of the default candidate range
constexpr uint16_t PORT_RANGE_SIZE = 50;    ///< Number of consecutive candidate ports

/**
 * @brief Ports that are never bound or probed.
 *
 * Some antivirus and monitoring software reacts to any access on these ports,
 * so touching them produces false alarms.
 */
constexpr std::array<uint16_t, 3> FORBIDDEN_PORTS = {6953, 6969, 6970};

/**
 * @brief Checks whether a port is on the deny-list.
 * @param port Port number to check.
 * @return True if the port must never be bound or probed.
 */
[[nodiscard]] bool isPortForbidden(uint16_t port);

/**
 * @brief A contiguous span of candidate ports.
 */
struct PortRange {
    uint16_t first{PORT_RANGE_START}; ///< First port of the range
    uint16_t size{PORT_RANGE_SIZE};   ///< Number of ports in the range

    /**
     * @brief Checks whether a port lies inside the range.
     * @param port Port number to check.
     * @return True if first <= port < first + size.
     */
    [[nodiscard]] bool contains(uint16_t port) const;

    /**
     * @brief Gets the usable ports in ascending order.
     * @return Ports of the range with the forbidden ports removed.
     */
    [[nodiscard]] std::vector<uint16_t> candidates() const;

    bool operator==(const PortRange& other) const = default;
};

} // namespace portlock::core
