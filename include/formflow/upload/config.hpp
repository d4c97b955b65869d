/**
 * @file config.hpp
 * @brief 上传会话配置 — 字段规则、限制、未知字段策略
 *
 * 使用示例:
 *   #include <formflow/upload/config.hpp>
 *
 *   formflow::upload_config cfg{
 *       .rules = {
 *           formflow::field_rule::single("avatar")
 *               .required()
 *               .with_mime_types({"image/*"}),
 *           formflow::field_rule::array("photos", 4).with_max_size(2 * 1024 * 1024),
 *       },
 *       .limits = {
 *           .max_file_size = 5 * 1024 * 1024,
 *           .max_files     = 5,
 *           .max_body_size = 16 * 1024 * 1024,
 *       },
 *   };
 *
 *   auto up = formflow::uploader::create(cfg, storage);   // validate() 在此执行
 */
#pragma once

#include <formflow/config.hpp>
#include <formflow/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace formflow {

// =============================================================================
// limits — 全局上限（均为闭区间，未设置 = 不限）
// =============================================================================

struct limits {
    /// 单个文件最大字节数
    std::optional<std::uint64_t> max_file_size;

    /// 单个普通字段最大字节数
    std::optional<std::uint64_t> max_field_size;

    /// 最大文件数
    std::optional<std::size_t> max_files;

    /// 最大普通字段数
    std::optional<std::size_t> max_fields;

    /// 请求体总字节数（含 boundary 与 part headers）
    std::optional<std::uint64_t> max_body_size;

    /// 单个 part header 块上限
    std::size_t max_header_size = FORMFLOW_DEFAULT_MAX_HEADER_SIZE;

    /// MIME 白名单（空 = 全部允许），支持 "*"、"*/*"、"type/*"
    std::vector<std::string> allowed_mime_types;
};

// =============================================================================
// field_rule — 字段选择规则
// =============================================================================

enum class selector_kind {
    single,   // 指定字段，至多 1 个文件
    array,    // 指定字段，至多 max 个文件
    fields,   // 一组字段名，每个至多 max 个文件
    none,     // 拒绝文件（无名 = 全部，具名 = 该字段）
    any,      // 接受任意字段名
};

[[nodiscard]] auto to_string(selector_kind k) noexcept -> std::string_view;

/// 字段规则。通过工厂函数构造，修饰函数返回新副本；交给 uploader 后不再改变
class field_rule {
public:
    [[nodiscard]] static auto single(std::string name) -> field_rule;
    [[nodiscard]] static auto array(std::string name,
                                    std::optional<std::size_t> max_count = std::nullopt)
        -> field_rule;
    [[nodiscard]] static auto fields(std::vector<std::string> names,
                                     std::optional<std::size_t> max_count = std::nullopt)
        -> field_rule;
    [[nodiscard]] static auto none() -> field_rule;
    [[nodiscard]] static auto none(std::string name) -> field_rule;
    [[nodiscard]] static auto any() -> field_rule;

    // --- 修饰 ---

    [[nodiscard]] auto with_min(std::size_t n) const -> field_rule;
    [[nodiscard]] auto required() const -> field_rule { return with_min(1); }
    [[nodiscard]] auto with_mime_types(std::vector<std::string> types) const -> field_rule;
    [[nodiscard]] auto with_max_size(std::uint64_t bytes) const -> field_rule;

    // --- 查询 ---

    [[nodiscard]] auto kind() const noexcept -> selector_kind { return kind_; }
    [[nodiscard]] auto names() const noexcept -> const std::vector<std::string>& { return names_; }
    [[nodiscard]] auto min_count() const noexcept -> std::size_t { return min_count_; }
    [[nodiscard]] auto max_count() const noexcept -> std::optional<std::size_t> { return max_count_; }
    [[nodiscard]] auto mime_types() const noexcept -> const std::vector<std::string>& { return mime_types_; }
    [[nodiscard]] auto max_size() const noexcept -> std::optional<std::uint64_t> { return max_size_; }

    /// 具名规则（single/array/fields/none(name)）
    [[nodiscard]] auto is_exact() const noexcept -> bool { return !names_.empty(); }

    [[nodiscard]] auto matches(std::string_view field) const noexcept -> bool;

private:
    field_rule(selector_kind kind, std::vector<std::string> names,
               std::optional<std::size_t> max_count);

    selector_kind kind_;
    std::vector<std::string> names_;
    std::size_t min_count_ = 0;
    std::optional<std::size_t> max_count_;
    std::vector<std::string> mime_types_;
    std::optional<std::uint64_t> max_size_;
};

// =============================================================================
// upload_config
// =============================================================================

/// 未匹配任何规则的文件 part 的处理方式
enum class unknown_field_policy {
    reject,   // 中止会话（unexpected_field）
    ignore,   // 丢弃该 part 的内容，继续解析
};

struct upload_config {
    /// 字段规则（空 = 等同 any）
    std::vector<field_rule> rules;

    formflow::limits limits;

    unknown_field_policy policy = unknown_field_policy::reject;
};

/// 构造期校验；失败返回 config 类错误，field 指出出错的规则或限制名
[[nodiscard]] auto validate(const upload_config& cfg)
    -> std::expected<void, upload_error>;

} // namespace formflow
