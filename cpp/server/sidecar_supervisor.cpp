#include "sidecar_supervisor.hpp"
#include "sidecar_resolver.hpp"

#include <iostream>
#include <stdexcept>

namespace sidecar {

const char* to_string(SupervisorState state) {
    switch (state) {
    case SupervisorState::Idle:
        return "idle";
    case SupervisorState::Launching:
        return "launching";
    case SupervisorState::RunningPortUnknown:
        return "running (port unknown)";
    case SupervisorState::RunningPortKnown:
        return "running (port known)";
    case SupervisorState::Failed:
        return "failed";
    case SupervisorState::Terminated:
        return "terminated";
    }
    return "unknown";
}

SidecarSupervisor::SidecarSupervisor(SupervisorOptions options, EventRelay& relay,
                                     SeverityPolicy policy)
    : options_(std::move(options)),
      relay_(relay),
      parser_(registry_, relay_, std::move(policy)) {}

SidecarSupervisor::~SidecarSupervisor() {
    stop();
}

std::vector<std::string> SidecarSupervisor::launch_args(const std::vector<std::string>& extra_args) {
    std::vector<std::string> args = {"--port", "0"};
    args.insert(args.end(), extra_args.begin(), extra_args.end());
    return args;
}

void SidecarSupervisor::start() {
    // stop() 要么等 start() 完成后再停 Worker，要么先到并使之后的 start() 失败
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (stopped_) {
        throw std::logic_error("Sidecar supervisor already stopped");
    }
    if (started_) {
        throw std::logic_error("Sidecar supervisor already started");
    }
    started_ = true;

    state_ = SupervisorState::Launching;
    std::cout << "[SidecarSupervisor] Starting sidecar " << options_.sidecar << "..." << std::endl;

    try {
        std::string program = resolve_sidecar(options_.binaries_dir, options_.sidecar);
        launcher_ = std::make_unique<ProcessLauncher>(program);
        launcher_->spawn(launch_args(options_.extra_args), events_);
        state_ = SupervisorState::RunningPortUnknown;
    } catch (const SpawnFailure& e) {
        // 启动失败也走 drain 线程，保证通知顺序一致
        std::cerr << "[SidecarSupervisor] Failed to spawn sidecar: " << e.what() << std::endl;
        state_ = SupervisorState::Failed;
        events_.push(StreamEvent::spawn_error(e.what()));
    }

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    drain_thread_ = std::thread(&SidecarSupervisor::run_drain, this);
}

void SidecarSupervisor::run_drain() {
    parser_.drain(events_, options_.startup_timeout, [this]() {
        if (launcher_) {
            std::cerr << "[SidecarSupervisor] Stopping sidecar after startup timeout" << std::endl;
            launcher_->stop(options_.stop_grace);
        }
    });

    if (state_ != SupervisorState::Failed) {
        state_ = SupervisorState::Terminated;
    }
    std::cout << "[SidecarSupervisor] Supervision ended (" << to_string(state()) << ")" << std::endl;
}

void SidecarSupervisor::stop() {
    ProcessLauncher* launcher = nullptr;
    {
        std::lock_guard<std::mutex> lock(start_mutex_);
        stopped_ = true;
        launcher = launcher_.get();
    }
    if (launcher) {
        // Worker 退出后读线程会投递 Terminated，drain 循环随之结束
        launcher->stop(options_.stop_grace);
    }
    events_.close();
    wait();
}

void SidecarSupervisor::wait() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (drain_thread_.joinable() && drain_thread_.get_id() != std::this_thread::get_id()) {
        drain_thread_.join();
    }
}

SupervisorState SidecarSupervisor::state() const {
    SupervisorState state = state_.load();
    if (state == SupervisorState::RunningPortUnknown && registry_.has_port()) {
        return SupervisorState::RunningPortKnown;
    }
    return state;
}

} // namespace sidecar
