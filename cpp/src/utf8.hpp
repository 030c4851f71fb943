#pragma once

#include <string>
#include <string_view>

namespace sidecar {

/**
 * 把任意字节转成合法 UTF-8
 *
 * 每个非法序列（按最长合法前缀计）替换为一个 U+FFFD，合法部分原样保留。
 * proto3 string 字段和 Python str 都要求合法 UTF-8，Worker 输出和日志文件不保证这一点。
 */
std::string to_valid_utf8(std::string_view bytes);

} // namespace sidecar
