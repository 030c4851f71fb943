#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "event_channel.hpp"
#include "stream_event.hpp"

namespace sidecar {

/**
 * SpawnFailure - Worker 无法启动（找不到可执行文件、exec 被拒绝、fork 失败等）
 */
class SpawnFailure : public std::runtime_error {
public:
    explicit SpawnFailure(const std::string& reason) : std::runtime_error(reason) {}
};

/**
 * ProcessLauncher - Sidecar Worker 进程启动器
 *
 * 负责：
 * 1. 派生 Worker 子进程，stdout / stderr 重定向到 pipe
 * 2. 读线程把两个 pipe 的输出按行转换为 StreamEvent
 * 3. 回收子进程并投递 Terminated 事件
 * 4. stop() 时先 SIGTERM 后 SIGKILL
 */
class ProcessLauncher {
public:
    /**
     * 构造函数
     * @param program Worker 可执行文件路径
     */
    explicit ProcessLauncher(const std::string& program);

    ~ProcessLauncher();

    // 禁止拷贝
    ProcessLauncher(const ProcessLauncher&) = delete;
    ProcessLauncher& operator=(const ProcessLauncher&) = delete;

    /**
     * 派生 Worker 进程
     * @param args 命令行参数（不含 argv[0]）
     * @param events 输出事件通道，必须比 launcher 活得更久
     * @throws SpawnFailure 如果进程无法启动
     */
    void spawn(const std::vector<std::string>& args, EventChannel<StreamEvent>& events);

    /**
     * 停止 Worker 进程，最多等待 grace 后强制 SIGKILL
     */
    void stop(std::chrono::milliseconds grace = std::chrono::seconds(5));

    /**
     * 检查 Worker 是否存活
     */
    bool is_alive() const;

    /**
     * 获取 Worker PID，未运行时为 -1
     */
    pid_t get_pid() const;

    const std::string& program() const { return program_; }

private:
    void pump(EventChannel<StreamEvent>* events);

    std::string program_;

    mutable std::mutex mutex_;
    std::mutex stop_mutex_;  // stop() 可能同时被多个线程调用
    std::condition_variable exited_cv_;
    pid_t worker_pid_ = -1;
    bool exited_ = false;

    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::thread reader_thread_;
};

} // namespace sidecar
