#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace formflow::multipart {

/// 单个 part 的 header 列表（保持出现顺序，名称原样保存）
struct part_header_list {
    std::vector<std::pair<std::string, std::string>> entries;

    /// 名称大小写不敏感查找；同名多次出现时取第一个
    [[nodiscard]] auto find(std::string_view name) const
        -> std::optional<std::string_view>;
};

/// 解析后的 part 元数据
struct part_info {
    std::string field_name;
    std::optional<std::string> file_name;   // 出现 filename 属性即为文件 part
    std::string content_type;               // 小写 essence，已填默认值
    part_header_list headers;

    [[nodiscard]] auto is_file() const noexcept -> bool {
        return file_name.has_value();
    }
};

/// 把 header 块拆成 "Name: value" 列表
/// 支持以 SP/HTAB 开头的续行；不含 ':' 的行 → invalid_header
[[nodiscard]] auto split_header_lines(std::string_view block)
    -> std::expected<part_header_list, std::error_code>;

/// 解析 part header 块
/// 错误：invalid_header、missing_field_name（缺少 Content-Disposition 或其 name 属性）
[[nodiscard]] auto parse_part_headers(std::string_view block)
    -> std::expected<part_info, std::error_code>;

} // namespace formflow::multipart
