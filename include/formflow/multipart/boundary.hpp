#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace formflow::multipart {

/// RFC 2046 bchars（DIGIT / ALPHA / '()+_,-./:=? 以及空格）
[[nodiscard]] auto is_boundary_char(char c) noexcept -> bool;

/// 校验 boundary：1..70 字符，全部属于 bchars，不以空格结尾
[[nodiscard]] auto validate_boundary(std::string_view boundary)
    -> std::expected<void, std::error_code>;

/// 从请求的 Content-Type 提取 boundary
/// 错误：
///   invalid_content_type  媒体类型不是 multipart/form-data
///   missing_boundary      缺少 boundary 参数
///   invalid_boundary      boundary 不合法
[[nodiscard]] auto extract_boundary(std::string_view content_type)
    -> std::expected<std::string, std::error_code>;

} // namespace formflow::multipart
