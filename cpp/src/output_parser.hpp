#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "endpoint_registry.hpp"
#include "event_channel.hpp"
#include "event_relay.hpp"
#include "stream_event.hpp"

namespace sidecar {

/**
 * stdout 端口标记："SERVER_PORT=<decimal>"
 */
constexpr std::string_view kPortMarker = "SERVER_PORT=";

enum class Severity {
    Info,
    Error,
};

/**
 * stderr 分级策略（可替换）
 */
using SeverityPolicy = std::function<Severity(std::string_view line)>;

/**
 * 默认策略：大小写不敏感地匹配 "error" / "failed" / "exception"
 */
Severity classify_stderr_line(std::string_view line);

/**
 * 单行 stdout 的解析结果
 */
struct PortLine {
    enum class Kind {
        NoMarker,   // 普通诊断输出
        Port,       // 解析成功
        Malformed,  // 有标记但数字不合法
    };

    Kind kind = Kind::NoMarker;
    uint16_t port = 0;
    std::string raw_value;  // Malformed 时的原始值，用于日志
};

PortLine parse_port_line(std::string_view line);

/**
 * OutputParser - 消费 Worker 的 StreamEvent
 *
 * 1. 从 stdout 提取端口，写入 EndpointRegistry（只写一次）并通知 PortReady
 * 2. stderr 按 SeverityPolicy 分级记录日志
 * 3. SpawnError / Terminated 转成通知并结束循环
 */
class OutputParser {
public:
    OutputParser(EndpointRegistry& registry, EventRelay& relay,
                 SeverityPolicy policy = classify_stderr_line);

    // 禁止拷贝
    OutputParser(const OutputParser&) = delete;
    OutputParser& operator=(const OutputParser&) = delete;

    /**
     * 处理一个事件
     * @return false 表示 drain 循环应结束（SpawnError / Terminated）
     */
    bool handle(const StreamEvent& event);

    /**
     * 持续消费通道直到终止事件或通道关闭
     *
     * @param channel 事件通道
     * @param startup_timeout 等待端口的超时，0 表示不限时
     * @param on_startup_timeout 超时后调用一次（通常用来停掉 Worker）
     */
    void drain(EventChannel<StreamEvent>& channel,
               std::chrono::milliseconds startup_timeout = std::chrono::milliseconds::zero(),
               std::function<void()> on_startup_timeout = {});

    size_t parse_anomalies() const { return parse_anomalies_; }
    size_t worker_errors() const { return worker_errors_; }
    size_t diagnostic_lines() const { return diagnostic_lines_; }
    bool finished() const { return finished_; }

private:
    void handle_stdout(const std::string& line);
    void handle_stderr(const std::string& line);
    void handle_startup_timeout(std::chrono::milliseconds timeout);

    EndpointRegistry& registry_;
    EventRelay& relay_;
    SeverityPolicy policy_;

    bool finished_ = false;
    bool timed_out_ = false;

    // 统计信息
    size_t parse_anomalies_ = 0;
    size_t worker_errors_ = 0;
    size_t diagnostic_lines_ = 0;
};

} // namespace sidecar
