/**
 * python_bindings.cpp - pybind11 绑定
 *
 * 将 C++ SidecarSupervisor 暴露为 Python 模块 sidecar._core，
 * 供 Python 前端直接查询端口和监听 Sidecar 生命周期通知。
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include <chrono>
#include <memory>

#include "event_relay.hpp"
#include "log_reader.hpp"
#include "sidecar_supervisor.hpp"
#include "utf8.hpp"

namespace py = pybind11;

namespace sidecar {

namespace {

py::object payload_of(const NotificationEvent& event) {
    switch (event.kind) {
    case NotificationEvent::Kind::PortReady:
        return py::int_(event.port);
    case NotificationEvent::Kind::WorkerError:
        return py::str(to_valid_utf8(event.message));
    case NotificationEvent::Kind::WorkerTerminated:
        if (event.exit_code.has_value()) {
            return py::int_(*event.exit_code);
        }
        return py::none();
    }
    return py::none();
}

} // anonymous namespace

/**
 * Python 兼容的 Sidecar 宿主包装器
 *
 * 处理：
 * 1. Python 回调（GIL 管理，回调在 drain 线程上执行）
 * 2. PortNotAvailable -> RuntimeError
 */
class PySidecarHost {
public:
    PySidecarHost(const std::string& sidecar,
                  const std::string& binaries_dir,
                  const std::vector<std::string>& args,
                  double startup_timeout)
        : supervisor_(make_options(sidecar, binaries_dir, args, startup_timeout), relay_) {}

    ~PySidecarHost() {
        // drain 线程可能正在等 GIL 执行回调，停止时必须释放 GIL
        py::gil_scoped_release release;
        supervisor_.stop();
    }

    void start() {
        py::gil_scoped_release release;
        supervisor_.start();
    }

    void stop() {
        py::gil_scoped_release release;
        supervisor_.stop();
    }

    uint16_t get_sidecar_port() const {
        // PortNotAvailable 继承自 std::runtime_error，pybind11 转换为 RuntimeError
        return supervisor_.get_sidecar_port();
    }

    /**
     * 注册 callback(name, payload)
     */
    EventRelay::ListenerId listen(py::function callback) {
        // std::function 会在没有 GIL 的线程上被复制，Python 对象的引用计数只能在持有 GIL 时改动
        std::shared_ptr<py::function> holder(new py::function(std::move(callback)),
                                             [](py::function* f) {
                                                 py::gil_scoped_acquire acquire;
                                                 delete f;
                                             });
        return relay_.subscribe([holder](const NotificationEvent& event) {
            py::gil_scoped_acquire acquire;
            try {
                (*holder)(event.name(), payload_of(event));
            } catch (const py::error_already_set& e) {
                throw std::runtime_error(std::string("Python listener error: ") + e.what());
            }
        });
    }

    bool unlisten(EventRelay::ListenerId id) {
        return relay_.unsubscribe(id);
    }

    std::string state() const {
        return to_string(supervisor_.state());
    }

    bool is_running() const {
        auto state = supervisor_.state();
        return state == SupervisorState::RunningPortUnknown ||
               state == SupervisorState::RunningPortKnown;
    }

private:
    static SupervisorOptions make_options(const std::string& sidecar,
                                          const std::string& binaries_dir,
                                          const std::vector<std::string>& args,
                                          double startup_timeout) {
        SupervisorOptions options;
        options.sidecar = sidecar;
        options.binaries_dir = binaries_dir;
        options.extra_args = args;
        options.startup_timeout = std::chrono::milliseconds(
            static_cast<long long>(startup_timeout * 1000.0));
        return options;
    }

    EventRelay relay_;
    SidecarSupervisor supervisor_;
};

} // namespace sidecar

PYBIND11_MODULE(_core, m) {
    m.doc() = "Sidecar Host C++ Core - sidecar process supervision";

    py::class_<sidecar::PySidecarHost>(m, "SidecarHost")
        .def(py::init<const std::string&, const std::string&, const std::vector<std::string>&, double>(),
             py::arg("sidecar"),
             py::arg("binaries_dir") = "binaries",
             py::arg("args") = std::vector<std::string>{},
             py::arg("startup_timeout") = 0.0,
             R"doc(
             创建 Sidecar 宿主

             Args:
                 sidecar: Sidecar 名称或可执行文件路径
                 binaries_dir: 打包后的 Sidecar 目录
                 args: 追加在 "--port 0" 之后的参数
                 startup_timeout: 等待 SERVER_PORT 的秒数（0 = 不限时）
             )doc")
        .def("start", &sidecar::PySidecarHost::start,
             "启动 Sidecar")
        .def("stop", &sidecar::PySidecarHost::stop,
             "停止 Sidecar")
        .def("get_sidecar_port", &sidecar::PySidecarHost::get_sidecar_port,
             "获取 Sidecar 端口，尚未可用时抛出 RuntimeError")
        .def("listen", &sidecar::PySidecarHost::listen,
             py::arg("callback"),
             "注册 callback(name, payload)，返回监听 id")
        .def("unlisten", &sidecar::PySidecarHost::unlisten,
             py::arg("listener_id"),
             "注销监听")
        .def_property_readonly("state", &sidecar::PySidecarHost::state,
             "监管状态")
        .def_property_readonly("is_running", &sidecar::PySidecarHost::is_running,
             "Sidecar 是否正在运行");

    m.def("get_log_contents", &sidecar::read_log_contents,
          py::arg("log_dir"),
          "按修改时间拼接日志目录下的 .log 文件");

    m.attr("__version__") = "0.1.0";
}
