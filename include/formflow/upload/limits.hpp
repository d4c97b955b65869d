#pragma once

#include <formflow/core/error.hpp>
#include <formflow/upload/config.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace formflow {

/// MIME 匹配：'*'、"*/*"、"type/*"、精确匹配，大小写不敏感
[[nodiscard]] auto mime_matches(std::string_view pattern, std::string_view type) noexcept
    -> bool;

/// 任一模式匹配即为允许；空列表 = 全部允许
[[nodiscard]] auto mime_allowed(std::span<const std::string> patterns,
                                std::string_view type) noexcept -> bool;

/// 会话级计数器与上限检查
/// 所有上限均为闭区间：等于上限接受，多一个字节 / 一个 part 即拒绝
class limit_enforcer {
public:
    explicit limit_enforcer(const formflow::limits& l) noexcept : limits_(l) {}

    /// 原始请求体分块到达（在进入 boundary 扫描之前）→ body_too_large
    [[nodiscard]] auto on_body_chunk(std::size_t n) -> std::expected<void, upload_error>;

    /// 已接受的 part 开始：计数 (1-indexed) 与 MIME 检查
    /// 错误：too_many_files / too_many_fields / disallowed_mime_type
    [[nodiscard]] auto begin_part(std::string_view field, bool is_file,
                                  std::string_view content_type,
                                  const field_rule* rule)
        -> std::expected<void, upload_error>;

    /// 当前 part 的 body 字节（在交给存储之前）→ file_too_large / field_too_large
    [[nodiscard]] auto on_part_data(std::size_t n) -> std::expected<void, upload_error>;

    void end_part() noexcept;

    [[nodiscard]] auto body_bytes() const noexcept -> std::uint64_t { return body_bytes_; }
    [[nodiscard]] auto file_count() const noexcept -> std::size_t { return files_; }
    [[nodiscard]] auto field_count() const noexcept -> std::size_t { return fields_; }
    [[nodiscard]] auto part_bytes() const noexcept -> std::uint64_t { return part_bytes_; }

    /// 当前 part 的有效大小上限（规则覆盖优先）
    [[nodiscard]] auto part_limit() const noexcept -> std::optional<std::uint64_t> {
        return part_limit_;
    }

private:
    const formflow::limits& limits_;

    std::uint64_t body_bytes_ = 0;
    std::size_t files_ = 0;
    std::size_t fields_ = 0;

    // 当前 part
    std::string part_field_;
    bool part_is_file_ = false;
    std::uint64_t part_bytes_ = 0;
    std::optional<std::uint64_t> part_limit_;
};

} // namespace formflow
