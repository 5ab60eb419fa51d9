#include "core/types/CandidatePorts.hpp"

#include <algorithm>

namespace portlock::core {

bool isPortForbidden(uint16_t port) {
    return std::find(FORBIDDEN_PORTS.begin(), FORBIDDEN_PORTS.end(), port) !=
           FORBIDDEN_PORTS.end();
}

bool PortRange::contains(uint16_t port) const {
    return port >= first && static_cast<uint32_t>(port) < static_cast<uint32_t>(first) + size;
}

std::vector<uint16_t> PortRange::candidates() const {
    std::vector<uint16_t> ports;
    ports.reserve(size);

    uint32_t last = std::min<uint32_t>(static_cast<uint32_t>(first) + size, 65536);
    for (uint32_t p = first; p < last; ++p) {
        auto port = static_cast<uint16_t>(p);
        if (!isPortForbidden(port)) {
            ports.push_back(port);
        }
    }
    return ports;
}

} // namespace portlock::core
