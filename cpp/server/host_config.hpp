#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "sidecar_supervisor.hpp"

namespace sidecar {

/**
 * HostConfig - sidecar_host 可执行文件的配置
 */
struct HostConfig {
    SupervisorOptions supervisor;
    std::string bind_address = "127.0.0.1";
    int port = 50151;  // gRPC 端口，0 = 随机分配
    std::string log_dir = "logs";
    bool show_help = false;

    std::string listen_address() const { return bind_address + ":" + std::to_string(port); }
};

/**
 * 从命令行和环境变量解析配置
 *
 * 环境变量 SIDECAR_BINARIES_DIR / SIDECAR_LOG_DIR 提供默认值，命令行优先。
 * "--" 之后的参数原样传给 Worker。
 * @throws std::invalid_argument 如果参数不合法
 */
HostConfig parse_host_config(int argc, const char* const* argv);

void print_usage(const char* program);

} // namespace sidecar
