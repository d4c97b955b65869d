#pragma once

#include <formflow/config.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace formflow {

// =============================================================================
// 错误码枚举
// =============================================================================

/// formflow 错误码
enum class errc {
    success = 0,

    // 配置相关 (构造期)
    invalid_limit,
    invalid_rule,
    conflicting_rules,
    destination_unwritable,

    // 解析相关
    invalid_content_type,
    missing_boundary,
    invalid_boundary,
    malformed_boundary,
    unexpected_eof,
    header_too_large,
    invalid_header,
    missing_field_name,
    body_stream_failed,

    // 限制相关
    file_too_large,
    field_too_large,
    body_too_large,
    too_many_files,
    too_many_fields,
    disallowed_mime_type,
    unexpected_field,
    missing_required_field,

    // 存储相关
    io_error,
    permission_denied,
    no_space,
    file_exists,
    filter_rejected,

    // 取消
    cancelled,
};

/// 错误分类，对应会话层的四类错误 + 取消
enum class error_kind {
    none,
    config,
    parse,
    limit,
    storage,
    cancelled,
};

// =============================================================================
// error_category
// =============================================================================

class upload_error_category : public std::error_category {
public:
    [[nodiscard]] auto name() const noexcept -> const char* override {
        return "formflow";
    }

    [[nodiscard]] auto message(int ev) const -> std::string override;
};

/// 获取全局 upload_error_category 实例
[[nodiscard]] inline auto upload_category() noexcept
    -> const std::error_category&
{
    static const upload_error_category instance;
    return instance;
}

/// 创建 std::error_code
[[nodiscard]] inline auto make_error_code(errc e) noexcept
    -> std::error_code
{
    return {static_cast<int>(e), upload_category()};
}

/// errc → 分类
[[nodiscard]] auto kind_of(errc e) noexcept -> error_kind;

/// error_code → 分类；非 formflow 类别的错误码视为 storage
[[nodiscard]] auto kind_of(const std::error_code& ec) noexcept -> error_kind;

[[nodiscard]] auto to_string(error_kind k) noexcept -> std::string_view;

/// 将平台原生错误码转换为 formflow::errc
[[nodiscard]] auto from_native_error(int native_error) noexcept -> errc;

// =============================================================================
// upload_error — 会话层错误
// =============================================================================

/// 会话层错误：错误码 + 上下文
/// 底层组件只返回 std::error_code，由 uploader 补充字段名与限制值
struct upload_error {
    std::error_code code;
    std::string field;                 // 出错字段名，可空
    std::uint64_t limit = 0;           // 被违反的上限，无则 0
    std::error_code cause;             // 底层 I/O 错误
    std::vector<std::error_code> cleanup_failures;

    [[nodiscard]] auto kind() const noexcept -> error_kind {
        return kind_of(code);
    }

    [[nodiscard]] auto is(errc e) const noexcept -> bool {
        return code == make_error_code(e);
    }

    [[nodiscard]] auto message() const -> std::string;
};

[[nodiscard]] inline auto make_upload_error(errc e, std::string field = {},
                                            std::uint64_t limit = 0)
    -> upload_error
{
    upload_error err;
    err.code = make_error_code(e);
    err.field = std::move(field);
    err.limit = limit;
    return err;
}

/// 包装底层错误码；formflow 类别的错误码原样保留，其余作为 cause
[[nodiscard]] auto wrap_error(std::error_code ec, std::string field = {})
    -> upload_error;

} // namespace formflow

// 注册到 std::error_code 系统
template <>
struct std::is_error_code_enum<formflow::errc> : std::true_type {};
