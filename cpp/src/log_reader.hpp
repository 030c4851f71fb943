#pragma once

#include <string>

namespace sidecar {

constexpr const char* kNoLogsSentinel = "No logs available.";

/**
 * 读取日志目录下的所有 .log 文件
 *
 * 按修改时间升序拼接，每个文件前加 "=== <文件名> ===" 标题。
 * 目录不存在或没有日志时返回 kNoLogsSentinel。
 */
std::string read_log_contents(const std::string& log_dir);

} // namespace sidecar
