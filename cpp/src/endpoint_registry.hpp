#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace sidecar {

/**
 * EndpointRegistry - Worker 端口的共享存储
 *
 * 只写一次：第一次 set() 生效，之后的 set() 都是 no-op，不会覆盖。
 * get() 可以在任意线程并发调用。
 */
class EndpointRegistry {
public:
    /**
     * 记录端口
     * @return true 如果本次写入生效（此前未设置）
     */
    bool set(uint16_t port);

    std::optional<uint16_t> get() const;

    bool has_port() const { return get().has_value(); }

private:
    mutable std::mutex mutex_;
    std::optional<uint16_t> port_;
};

/**
 * PortNotAvailable - 查询端口时 Registry 尚未写入
 */
class PortNotAvailable : public std::runtime_error {
public:
    static constexpr const char* kMessage = "Sidecar port not yet available";

    PortNotAvailable() : std::runtime_error(kMessage) {}
};

/**
 * 查询端点：返回当前端口
 * @throws PortNotAvailable 如果端口尚未发现
 */
uint16_t get_sidecar_port(const EndpointRegistry& registry);

} // namespace sidecar
