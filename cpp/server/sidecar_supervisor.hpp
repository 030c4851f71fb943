#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "endpoint_registry.hpp"
#include "event_channel.hpp"
#include "event_relay.hpp"
#include "output_parser.hpp"
#include "process_launcher.hpp"
#include "stream_event.hpp"

namespace sidecar {

struct SupervisorOptions {
    std::string sidecar = "vn-sidecar";          // Worker 标识或可执行文件路径
    std::string binaries_dir = "binaries";       // 打包后的 Worker 所在目录
    std::vector<std::string> extra_args;         // 追加在 "--port 0" 之后
    std::chrono::milliseconds startup_timeout{0};  // 0 = 不限时
    std::chrono::milliseconds stop_grace{5000};
};

enum class SupervisorState {
    Idle,
    Launching,
    RunningPortUnknown,
    RunningPortKnown,
    Failed,
    Terminated,
};

const char* to_string(SupervisorState state);

/**
 * SidecarSupervisor - 单个 Sidecar Worker 的监管者
 *
 * 启动 Worker，在独立线程上运行 OutputParser 消费其输出，
 * 端口写入 EndpointRegistry，生命周期事件通过 EventRelay 通知 GUI。
 * Worker 退出后不会自动重启。
 */
class SidecarSupervisor {
public:
    SidecarSupervisor(SupervisorOptions options, EventRelay& relay,
                      SeverityPolicy policy = classify_stderr_line);

    ~SidecarSupervisor();

    // 禁止拷贝
    SidecarSupervisor(const SidecarSupervisor&) = delete;
    SidecarSupervisor& operator=(const SidecarSupervisor&) = delete;

    /**
     * 启动 Worker 和 drain 线程（只能调用一次）
     *
     * 启动失败不会抛出：失败原因以 sidecar-error 通知发出，状态变为 Failed。
     * @throws std::logic_error 如果重复调用，或已经调用过 stop()
     */
    void start();

    /**
     * 停止 Worker 并等待 drain 线程结束
     */
    void stop();

    /**
     * 等待 drain 线程结束（Worker 退出或启动失败）
     */
    void wait();

    SupervisorState state() const;

    std::optional<uint16_t> get_port() const { return registry_.get(); }

    /**
     * @throws PortNotAvailable 如果端口尚未发现
     */
    uint16_t get_sidecar_port() const { return sidecar::get_sidecar_port(registry_); }

    const EndpointRegistry& registry() const { return registry_; }

    const OutputParser& parser() const { return parser_; }

    /**
     * Worker 命令行：自动分配端口的 "--port 0" 加上额外参数
     */
    static std::vector<std::string> launch_args(const std::vector<std::string>& extra_args);

private:
    void run_drain();

    SupervisorOptions options_;
    EventRelay& relay_;

    EndpointRegistry registry_;
    EventChannel<StreamEvent> events_;
    OutputParser parser_;

    std::unique_ptr<ProcessLauncher> launcher_;
    std::atomic<SupervisorState> state_{SupervisorState::Idle};

    std::mutex start_mutex_;
    bool started_ = false;
    bool stopped_ = false;

    std::mutex join_mutex_;
    std::thread drain_thread_;
};

} // namespace sidecar
