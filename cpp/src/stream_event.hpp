#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace sidecar {

/**
 * StreamEvent - 来自 Worker 进程的一次观测
 *
 * 由 ProcessLauncher 的读线程产生（SpawnError 由 Supervisor 产生），
 * 由 OutputParser 按到达顺序逐个消费。
 */
struct StreamEvent {
    enum class Kind {
        StdoutLine,
        StderrLine,
        SpawnError,
        Terminated,
    };

    Kind kind = Kind::StdoutLine;
    std::string text;              // StdoutLine / StderrLine 的行内容，SpawnError 的原因
    std::optional<int> exit_code;  // Terminated
    std::optional<int> signal;     // Terminated（被信号杀死时）

    static StreamEvent stdout_line(std::string line) {
        StreamEvent e;
        e.kind = Kind::StdoutLine;
        e.text = std::move(line);
        return e;
    }

    static StreamEvent stderr_line(std::string line) {
        StreamEvent e;
        e.kind = Kind::StderrLine;
        e.text = std::move(line);
        return e;
    }

    static StreamEvent spawn_error(std::string reason) {
        StreamEvent e;
        e.kind = Kind::SpawnError;
        e.text = std::move(reason);
        return e;
    }

    static StreamEvent terminated(std::optional<int> code, std::optional<int> sig = std::nullopt) {
        StreamEvent e;
        e.kind = Kind::Terminated;
        e.exit_code = code;
        e.signal = sig;
        return e;
    }
};

/**
 * NotificationEvent - 发往 GUI 边界的通知（fire-and-forget）
 */
struct NotificationEvent {
    enum class Kind {
        PortReady,
        WorkerError,
        WorkerTerminated,
    };

    Kind kind = Kind::PortReady;
    uint16_t port = 0;             // PortReady
    std::string message;           // WorkerError
    std::optional<int> exit_code;  // WorkerTerminated
    std::optional<int> signal;     // WorkerTerminated

    static NotificationEvent port_ready(uint16_t p) {
        NotificationEvent e;
        e.kind = Kind::PortReady;
        e.port = p;
        return e;
    }

    static NotificationEvent worker_error(std::string msg) {
        NotificationEvent e;
        e.kind = Kind::WorkerError;
        e.message = std::move(msg);
        return e;
    }

    static NotificationEvent worker_terminated(std::optional<int> code,
                                               std::optional<int> sig = std::nullopt) {
        NotificationEvent e;
        e.kind = Kind::WorkerTerminated;
        e.exit_code = code;
        e.signal = sig;
        return e;
    }

    /**
     * 边界事件名："sidecar-port" / "sidecar-error" / "sidecar-terminated"
     */
    const char* name() const {
        switch (kind) {
        case Kind::PortReady:
            return "sidecar-port";
        case Kind::WorkerError:
            return "sidecar-error";
        case Kind::WorkerTerminated:
            return "sidecar-terminated";
        }
        return "sidecar-unknown";
    }
};

} // namespace sidecar
