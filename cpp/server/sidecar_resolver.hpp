#pragma once

#include <string>

namespace sidecar {

/**
 * 当前编译目标的 target triple，例如 "x86_64-unknown-linux-gnu"
 */
std::string target_triple();

/**
 * 把 Worker 标识解析为可执行文件路径
 *
 * 查找顺序：
 * 1. name 含路径分隔符时直接使用
 * 2. <binaries_dir>/<name>-<target_triple>[.exe]
 * 3. <binaries_dir>/<name>
 *
 * @throws SpawnFailure 如果都不存在
 */
std::string resolve_sidecar(const std::string& binaries_dir, const std::string& name);

} // namespace sidecar
