#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "endpoint_registry.hpp"
#include "event_relay.hpp"

// Forward declarations for gRPC types
namespace grpc {
class Server;
class Channel;
}

namespace sidecar {

class SidecarHostServiceImpl;

/**
 * SidecarHostServer - GUI 边界的 gRPC 服务
 *
 * 提供：
 * 1. GetSidecarPort：同步查询端口
 * 2. Subscribe：sidecar-port / sidecar-error / sidecar-terminated 通知流
 * 3. GetLogContents：读取日志目录
 */
class SidecarHostServer {
public:
    /**
     * 构造函数
     *
     * @param listen_address 监听地址（例如 "127.0.0.1:50151"），空字符串表示只提供进程内 channel
     * @param registry 端口存储
     * @param relay 通知转发
     * @param log_dir 日志目录
     */
    SidecarHostServer(std::string listen_address, const EndpointRegistry& registry,
                      EventRelay& relay, std::string log_dir);

    ~SidecarHostServer();

    // 禁止拷贝
    SidecarHostServer(const SidecarHostServer&) = delete;
    SidecarHostServer& operator=(const SidecarHostServer&) = delete;

    /**
     * 启动 gRPC 服务器（非阻塞）
     * @throws std::runtime_error 如果无法启动
     */
    void start();

    /**
     * 启动并阻塞直到 stop()
     */
    void run();

    /**
     * 停止服务器，正在进行的 Subscribe 流会被结束
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * 实际监听的端口（配置为 0 时由系统分配）
     */
    int selected_port() const { return selected_port_; }

    /**
     * 进程内 channel，主要用于测试
     */
    std::shared_ptr<grpc::Channel> in_process_channel();

private:
    std::string listen_address_;
    int selected_port_ = 0;

    std::atomic<bool> running_{false};

    std::unique_ptr<SidecarHostServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
};

} // namespace sidecar
