#include "process_launcher.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sidecar {

namespace {

constexpr auto kExitCheckInterval = std::chrono::milliseconds(100);
constexpr size_t kReadChunk = 4096;
constexpr int kFinalDrainReads = 64;

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::string errno_text(int err) {
    return std::string(strerror(err));
}

/**
 * 把 pipe 读出的字节切成行（去掉结尾的 \r）
 */
class LineSplitter {
public:
    template <typename Emit>
    void feed(const char* data, size_t size, Emit&& emit) {
        pending_.append(data, size);
        size_t start = 0;
        size_t pos;
        while ((pos = pending_.find('\n', start)) != std::string::npos) {
            emit(strip_cr(pending_.substr(start, pos - start)));
            start = pos + 1;
        }
        pending_.erase(0, start);
    }

    template <typename Emit>
    void flush(Emit&& emit) {
        if (!pending_.empty()) {
            emit(strip_cr(std::move(pending_)));
            pending_.clear();
        }
    }

private:
    static std::string strip_cr(std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    }

    std::string pending_;
};

struct PipeStream {
    int fd = -1;
    bool is_stderr = false;
    LineSplitter lines;
};

} // anonymous namespace

ProcessLauncher::ProcessLauncher(const std::string& program)
    : program_(program) {}

ProcessLauncher::~ProcessLauncher() {
    stop();
}

void ProcessLauncher::spawn(const std::vector<std::string>& args, EventChannel<StreamEvent>& events) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (worker_pid_ > 0 || reader_thread_.joinable()) {
            throw SpawnFailure("Sidecar already spawned: " + program_);
        }
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
    };

    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
        pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close_all();
        throw SpawnFailure("Failed to create pipe: " + errno_text(err));
    }

    // 构建参数列表: <program> [args...]（fork 之前完成，子进程里不分配内存）
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program_.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw SpawnFailure("Fork failed: " + errno_text(err));
    }

    if (pid == 0) {
        // ===== 子进程 =====
        // dup2 出来的 fd 不带 CLOEXEC，其余 pipe 在 exec 时自动关闭
        if (dup2(out_pipe[1], STDOUT_FILENO) < 0 || dup2(err_pipe[1], STDERR_FILENO) < 0) {
            int err = errno;
            ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        execvp(program_.c_str(), argv.data());

        // 如果 execvp 返回，说明失败了，把 errno 告诉父进程
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // ===== 父进程 =====
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // exec 成功时 status pipe 被关闭，read 返回 0
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        close_all();
        waitpid(pid, nullptr, 0);
        throw SpawnFailure("Failed to exec " + program_ + ": " + errno_text(child_errno));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker_pid_ = pid;
        exited_ = false;
        stdout_fd_ = out_pipe[0];
        stderr_fd_ = err_pipe[0];
    }

    std::cout << "[ProcessLauncher] Spawned " << program_ << " (pid " << pid << ")" << std::endl;

    reader_thread_ = std::thread(&ProcessLauncher::pump, this, &events);
}

void ProcessLauncher::pump(EventChannel<StreamEvent>* events) {
    pid_t pid;
    PipeStream streams[2];
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid = worker_pid_;
        streams[0].fd = stdout_fd_;
        streams[1].fd = stderr_fd_;
        streams[1].is_stderr = true;
    }

    auto emit_line = [events](bool is_stderr) {
        return [events, is_stderr](std::string line) {
            events->push(is_stderr ? StreamEvent::stderr_line(std::move(line))
                                   : StreamEvent::stdout_line(std::move(line)));
        };
    };

    // 读一次；返回 false 表示该 pipe 已到 EOF 或出错
    auto read_once = [&](PipeStream& stream) {
        char buf[kReadChunk];
        ssize_t n = read(stream.fd, buf, sizeof(buf));
        if (n > 0) {
            stream.lines.feed(buf, static_cast<size_t>(n), emit_line(stream.is_stderr));
            return true;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            return true;
        }
        if (n < 0) {
            std::cerr << "[ProcessLauncher] Read error: " << strerror(errno) << std::endl;
        }
        stream.lines.flush(emit_line(stream.is_stderr));
        close_fd(stream.fd);
        return false;
    };

    // 定时检查进程是否已退出：孙进程可能还持有 pipe（甚至持续写入），不能只等 EOF
    auto worker_exited = [pid]() {
        siginfo_t info;
        std::memset(&info, 0, sizeof(info));
        return waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid;
    };
    auto next_exit_check = std::chrono::steady_clock::now() + kExitCheckInterval;

    bool exited_early = false;
    while (streams[0].fd >= 0 || streams[1].fd >= 0) {
        struct pollfd pfds[2];
        PipeStream* owners[2];
        nfds_t nfds = 0;
        for (auto& stream : streams) {
            if (stream.fd >= 0) {
                pfds[nfds].fd = stream.fd;
                pfds[nfds].events = POLLIN;
                pfds[nfds].revents = 0;
                owners[nfds] = &stream;
                nfds++;
            }
        }

        int ret = poll(pfds, nfds, static_cast<int>(kExitCheckInterval.count()));
        if (ret < 0 && errno != EINTR) {
            std::cerr << "[ProcessLauncher] Poll error: " << strerror(errno) << std::endl;
            break;
        }

        for (nfds_t i = 0; ret > 0 && i < nfds; ++i) {
            if (pfds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                read_once(*owners[i]);
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_exit_check) {
            if (worker_exited()) {
                exited_early = true;
                break;
            }
            next_exit_check = now + kExitCheckInterval;
        }
    }

    if (exited_early) {
        // 进程已退出，取走 pipe 中残留的数据
        for (auto& stream : streams) {
            for (int i = 0; i < kFinalDrainReads && stream.fd >= 0; ++i) {
                struct pollfd pfd;
                pfd.fd = stream.fd;
                pfd.events = POLLIN;
                pfd.revents = 0;
                if (poll(&pfd, 1, 0) <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) {
                    break;
                }
                if (!read_once(stream)) {
                    break;
                }
            }
            if (stream.fd >= 0) {
                stream.lines.flush(emit_line(stream.is_stderr));
                close_fd(stream.fd);
            }
        }
    }
    for (auto& stream : streams) {
        close_fd(stream.fd);
    }

    // 等待退出但暂不回收，回收在锁内完成，避免 stop() 向已复用的 pid 发信号
    siginfo_t info;
    int rc;
    do {
        std::memset(&info, 0, sizeof(info));
        rc = waitid(P_PID, pid, &info, WEXITED | WNOWAIT);
    } while (rc < 0 && errno == EINTR);

    std::optional<int> exit_code;
    std::optional<int> sig;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int status = 0;
        if (waitpid(pid, &status, 0) == pid) {
            if (WIFEXITED(status)) {
                exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                sig = WTERMSIG(status);
            }
        } else {
            std::cerr << "[ProcessLauncher] waitpid failed: " << strerror(errno) << std::endl;
        }
        worker_pid_ = -1;
        exited_ = true;
        stdout_fd_ = -1;
        stderr_fd_ = -1;
    }
    exited_cv_.notify_all();

    events->push(StreamEvent::terminated(exit_code, sig));
}

void ProcessLauncher::stop(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> stop_lock(stop_mutex_);
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (worker_pid_ > 0 && !exited_) {
            // 先发送 SIGTERM
            std::cout << "[ProcessLauncher] Stopping pid " << worker_pid_ << std::endl;
            kill(worker_pid_, SIGTERM);

            // 超时则强制 SIGKILL
            if (!exited_cv_.wait_for(lock, grace, [this] { return exited_; })) {
                std::cerr << "[ProcessLauncher] Worker ignored SIGTERM, sending SIGKILL" << std::endl;
                if (worker_pid_ > 0) {
                    kill(worker_pid_, SIGKILL);
                }
            }
        }
    }

    if (reader_thread_.joinable() && reader_thread_.get_id() != std::this_thread::get_id()) {
        reader_thread_.join();
    }
}

bool ProcessLauncher::is_alive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_pid_ > 0 && !exited_;
}

pid_t ProcessLauncher::get_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_pid_;
}

} // namespace sidecar
