#pragma once

#include <formflow/core/error.hpp>
#include <formflow/upload/config.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace formflow {

enum class selector_action {
    accept,
    ignore,   // unknown_field_policy::ignore 下丢弃该 part
};

struct selection {
    selector_action action = selector_action::accept;
    const field_rule* rule = nullptr;   // 命中的规则（可空）
};

/// 会话级字段选择器：按规则判定 part 是否接受，并统计每个字段的出现次数
/// 具名规则优先于 any；未配置任何规则时等同 any
class selector_engine {
public:
    selector_engine(const std::vector<field_rule>& rules, unknown_field_policy policy);

    /// 判定一个 part
    /// 错误：unexpected_field、too_many_files（文件 part 超出规则上限）、
    ///       too_many_fields（普通字段超出规则上限）
    [[nodiscard]] auto select(std::string_view field, bool is_file)
        -> std::expected<selection, upload_error>;

    /// 检查所有具名规则的最小出现次数 → missing_required_field
    [[nodiscard]] auto finish() const -> std::expected<void, upload_error>;

    /// 已接受的该字段 part 数
    [[nodiscard]] auto count(std::string_view field) const -> std::size_t;

private:
    [[nodiscard]] auto find_exact(std::string_view field) const -> const field_rule*;
    [[nodiscard]] auto unknown(std::string_view field) const
        -> std::expected<selection, upload_error>;

    const std::vector<field_rule>& rules_;
    unknown_field_policy policy_;
    const field_rule* any_rule_ = nullptr;
    std::unordered_map<std::string, std::size_t> counts_;
};

} // namespace formflow
