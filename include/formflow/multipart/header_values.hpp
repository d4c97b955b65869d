#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace formflow::multipart {

// =============================================================================
// 词法辅助
// =============================================================================

namespace detail {

/// 跳过 OWS (可选空白: SP / HTAB)
auto skip_ows(std::string_view s) noexcept -> std::string_view;

/// 去掉尾部 OWS
auto trim_ows(std::string_view s) noexcept -> std::string_view;

/// 解析引号字符串 (含 \" \\ 转义)，返回解引号后的值和剩余串
auto parse_quoted_string(std::string_view s)
    -> std::pair<std::string, std::string_view>;

/// 解析 token (RFC 7230: 非分隔符可见 ASCII)
auto parse_token(std::string_view s)
    -> std::pair<std::string, std::string_view>;

auto to_lower(std::string s) -> std::string;

/// ASCII 大小写不敏感比较
auto iequals(std::string_view a, std::string_view b) noexcept -> bool;

} // namespace detail

/// 百分号解码。`+` → 空格 (form 模式)。无效序列原样保留。
auto url_decode(std::string_view input, bool plus_as_space = true) -> std::string;

// =============================================================================
// Content-Type 解析
// =============================================================================

struct content_type {
    std::string mime;   // 小写 "type/subtype"
    std::unordered_map<std::string, std::string> params;   // 参数名小写

    [[nodiscard]] auto param(std::string_view key) const
        -> std::optional<std::string_view>;
};

/// 解析 Content-Type header value
/// e.g. "multipart/form-data; boundary=----abc; charset=utf-8"
/// 未加引号的参数值取到下一个 ';' 为止（去尾空白）
auto parse_content_type(std::string_view header) -> content_type;

// =============================================================================
// Content-Disposition 解析
// =============================================================================

struct content_disposition {
    std::string type;                           // "form-data", "attachment" 等
    std::optional<std::string> name;            // 字段名
    std::optional<std::string> filename;        // 原始文件名（出现即为文件 part，可为空串）
    std::optional<std::string> filename_star;   // RFC 5987 扩展文件名

    /// 返回有效文件名：优先 filename_star，其次 filename
    [[nodiscard]] auto effective_filename() const -> std::optional<std::string> {
        if (filename_star) return filename_star;
        return filename;
    }

    [[nodiscard]] auto has_filename() const noexcept -> bool {
        return filename.has_value() || filename_star.has_value();
    }
};

/// 解析 Content-Disposition header value
/// e.g. "form-data; name=\"field1\"; filename=\"my file.txt\""
auto parse_content_disposition(std::string_view header) -> content_disposition;

} // namespace formflow::multipart
