#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace formflow {

/// 把客户端文件名转换为安全的单一路径分量（纯函数）
///   - '/' '\\' NUL、控制字符与 <>:"|?* 替换为 '_'
///   - 连续的 '.' 折叠为一个；去掉开头的 '.' 与结尾的 '.' / 空格
///   - Windows 设备名（CON、NUL、COM1 ...）前加 '_'
///   - 最长 255 字节，保留扩展名，不截断 UTF-8 序列
///   - 结果为空时返回 "upload-<输入的 fnv1a64 十六进制>"
[[nodiscard]] auto sanitize_filename(std::string_view name) -> std::string;

/// 128 位随机标识，32 个小写十六进制字符
[[nodiscard]] auto random_identifier() -> std::string;

/// FNV-1a 64 位哈希
[[nodiscard]] auto fnv1a64(std::string_view data) noexcept -> std::uint64_t;

/// 取文件名扩展名（含 '.'，无则为空）
[[nodiscard]] auto file_extension(std::string_view name) -> std::string_view;

} // namespace formflow
