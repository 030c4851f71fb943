#include "endpoint_registry.hpp"

namespace sidecar {

bool EndpointRegistry::set(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (port_.has_value()) {
        return false;
    }
    port_ = port;
    return true;
}

std::optional<uint16_t> EndpointRegistry::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return port_;
}

uint16_t get_sidecar_port(const EndpointRegistry& registry) {
    auto port = registry.get();
    if (!port.has_value()) {
        throw PortNotAvailable();
    }
    return *port;
}

} // namespace sidecar
