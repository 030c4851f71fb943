#include "log_reader.hpp"
#include "utf8.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace sidecar {

namespace {

struct LogFile {
    fs::path path;
    fs::file_time_type mtime;
};

} // anonymous namespace

std::string read_log_contents(const std::string& log_dir) {
    std::error_code ec;
    if (!fs::is_directory(log_dir, ec)) {
        return kNoLogsSentinel;
    }

    std::vector<LogFile> files;
    fs::directory_iterator it(log_dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry.path().extension() != ".log") {
            continue;
        }
        auto mtime = entry.last_write_time(entry_ec);
        if (entry_ec) {
            std::cerr << "[LogReader] Cannot stat " << entry.path() << ": " << entry_ec.message() << std::endl;
            continue;
        }
        files.push_back({entry.path(), mtime});
    }
    if (ec) {
        std::cerr << "[LogReader] Failed to list " << log_dir << ": " << ec.message() << std::endl;
    }

    std::sort(files.begin(), files.end(), [](const LogFile& a, const LogFile& b) {
        if (a.mtime != b.mtime) {
            return a.mtime < b.mtime;
        }
        return a.path.filename() < b.path.filename();
    });

    std::string result;
    for (const auto& file : files) {
        std::ifstream in(file.path, std::ios::binary);
        if (!in) {
            std::cerr << "[LogReader] Cannot open " << file.path << ", skipped" << std::endl;
            continue;
        }
        std::ostringstream content;
        content << in.rdbuf();

        if (!result.empty()) {
            if (result.back() != '\n') {
                result += '\n';
            }
            result += '\n';
        }
        result += "=== " + file.path.filename().string() + " ===\n";
        result += content.str();
    }

    if (result.empty()) {
        return kNoLogsSentinel;
    }
    return to_valid_utf8(result);
}

} // namespace sidecar
