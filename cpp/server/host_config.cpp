#include "host_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace sidecar {

namespace {

int parse_int(const std::string& option, const std::string& value, int min_value, int max_value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    if (consumed != value.size() || parsed < min_value || parsed > max_value) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    return parsed;
}

} // anonymous namespace

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS] [-- WORKER_ARGS...]\n"
              << "\n"
              << "Options:\n"
              << "  --sidecar NAME            Sidecar name or path (default: vn-sidecar)\n"
              << "  --binaries-dir DIR        Directory of packaged sidecars (default: binaries,\n"
              << "                            env SIDECAR_BINARIES_DIR)\n"
              << "  --bind ADDR               gRPC bind address (default: 127.0.0.1)\n"
              << "  --port PORT               gRPC server port, 0 = auto (default: 50151)\n"
              << "  --log-dir DIR             Log directory (default: logs, env SIDECAR_LOG_DIR)\n"
              << "  --startup-timeout SECONDS Give up waiting for the sidecar port (default: 0 = never)\n"
              << "  --help                    Show this help message\n"
              << "\n"
              << "Example:\n"
              << "  " << program << " --sidecar vn-sidecar --port 50151 -- --log-level info\n"
              << std::endl;
}

HostConfig parse_host_config(int argc, const char* const* argv) {
    HostConfig config;

    if (const char* dir = std::getenv("SIDECAR_BINARIES_DIR")) {
        config.supervisor.binaries_dir = dir;
    }
    if (const char* dir = std::getenv("SIDECAR_LOG_DIR")) {
        config.log_dir = dir;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--sidecar") {
            config.supervisor.sidecar = next_value();
        } else if (arg == "--binaries-dir") {
            config.supervisor.binaries_dir = next_value();
        } else if (arg == "--bind") {
            config.bind_address = next_value();
        } else if (arg == "--port") {
            config.port = parse_int(arg, next_value(), 0, 65535);
        } else if (arg == "--log-dir") {
            config.log_dir = next_value();
        } else if (arg == "--startup-timeout") {
            int seconds = parse_int(arg, next_value(), 0, 24 * 60 * 60);
            config.supervisor.startup_timeout = std::chrono::seconds(seconds);
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                config.supervisor.extra_args.emplace_back(argv[i]);
            }
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (config.supervisor.sidecar.empty()) {
        throw std::invalid_argument("Sidecar name must not be empty");
    }
    return config;
}

} // namespace sidecar
