/**
 * main.cpp - sidecar_host 可执行文件入口
 *
 * 用法: sidecar_host [--sidecar NAME] [--port PORT] [-- WORKER_ARGS...]
 *
 * 这个可执行文件用于：
 * 1. 派生并监管 Sidecar Worker 进程（--port 0 自动分配端口）
 * 2. 从 Worker 的 stdout 获取 SERVER_PORT
 * 3. 通过 gRPC 向 GUI 提供端口查询和生命周期通知
 */

#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <chrono>
#include <thread>

#include "event_relay.hpp"
#include "host_config.hpp"
#include "sidecar_service.hpp"
#include "sidecar_supervisor.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int /*signal*/) {
    g_shutdown_requested = true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    sidecar::HostConfig config;
    try {
        config = sidecar::parse_host_config(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[main] " << e.what() << std::endl;
        sidecar::print_usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        sidecar::print_usage(argv[0]);
        return 0;
    }

    // 设置信号处理
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        sidecar::EventRelay relay;
        sidecar::SidecarSupervisor supervisor(config.supervisor, relay);

        // 1. 先启动 gRPC 服务，GUI 随时可以查询
        sidecar::SidecarHostServer server(config.listen_address(), supervisor.registry(),
                                          relay, config.log_dir);
        server.start();

        // 2. 派生 Sidecar
        supervisor.start();

        // 3. 主循环：Worker 退出后继续提供查询（不自动重启）
        bool reported_end = false;
        while (!g_shutdown_requested) {
            auto state = supervisor.state();
            if (!reported_end && (state == sidecar::SupervisorState::Terminated ||
                                  state == sidecar::SupervisorState::Failed)) {
                std::cerr << "[main] Sidecar supervision ended: " << sidecar::to_string(state)
                          << std::endl;
                reported_end = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // 4. 清理
        std::cout << "[main] Shutting down..." << std::endl;
        server.stop();
        supervisor.stop();

        std::cout << "[main] Done." << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Error: " << e.what() << std::endl;
        return 1;
    }
}
