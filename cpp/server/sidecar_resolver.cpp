#include "sidecar_resolver.hpp"
#include "process_launcher.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace sidecar {

std::string target_triple() {
#if defined(__APPLE__) && defined(__aarch64__)
    return "aarch64-apple-darwin";
#elif defined(__APPLE__) && defined(__x86_64__)
    return "x86_64-apple-darwin";
#elif defined(_WIN32) && (defined(_M_X64) || defined(__x86_64__))
    return "x86_64-pc-windows-msvc";
#elif defined(__linux__) && defined(__aarch64__)
    return "aarch64-unknown-linux-gnu";
#elif defined(__linux__) && defined(__x86_64__)
    return "x86_64-unknown-linux-gnu";
#else
    return "unknown";
#endif
}

std::string resolve_sidecar(const std::string& binaries_dir, const std::string& name) {
    if (name.empty()) {
        throw SpawnFailure("Sidecar name is empty");
    }

    std::error_code ec;
    if (name.find('/') != std::string::npos) {
        if (!fs::is_regular_file(name, ec)) {
            throw SpawnFailure("Sidecar binary not found: " + name);
        }
        return name;
    }

#ifdef _WIN32
    const std::string suffix = ".exe";
#else
    const std::string suffix;
#endif

    const fs::path candidates[] = {
        fs::path(binaries_dir) / (name + "-" + target_triple() + suffix),
        fs::path(binaries_dir) / (name + suffix),
    };

    for (const auto& candidate : candidates) {
        if (fs::is_regular_file(candidate, ec)) {
            std::cout << "[SidecarResolver] Using " << candidate.string() << std::endl;
            return candidate.string();
        }
    }

    throw SpawnFailure("Sidecar binary not found: " + candidates[0].string());
}

} // namespace sidecar
