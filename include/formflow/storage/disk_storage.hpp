/**
 * @file disk_storage.hpp
 * @brief 磁盘存储引擎 — 流式写入目标目录，失败时不留下任何文件
 *
 * 使用示例:
 *   auto disk = formflow::disk_storage::create({
 *       .destination = "/var/lib/app/uploads",
 *       .strategy    = formflow::filename_strategy::random(),
 *       .filter      = [](const formflow::file_meta& m) {
 *           return m.content_type != "application/x-msdownload";
 *       },
 *   });
 *   if (!disk) { ... disk.error().message() ... }
 */
#pragma once

#include <formflow/storage/storage.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace formflow {

// =============================================================================
// filename_strategy
// =============================================================================

/// 落盘文件名的生成方式；结果总会再经过 sanitize_filename
class filename_strategy {
public:
    enum class kind {
        keep,     // 清洗后的原始文件名
        random,   // 32 位十六进制随机名 + 原扩展名（不超过 32 字节）
        custom,   // 由元数据确定的自定义函数
    };

    using custom_fn = std::function<std::string(const file_meta&)>;

    [[nodiscard]] static auto keep() -> filename_strategy {
        return filename_strategy{kind::keep, {}};
    }
    [[nodiscard]] static auto random() -> filename_strategy {
        return filename_strategy{kind::random, {}};
    }
    [[nodiscard]] static auto custom(custom_fn fn) -> filename_strategy {
        return filename_strategy{kind::custom, std::move(fn)};
    }

    [[nodiscard]] auto type() const noexcept -> kind { return kind_; }

    /// 计算（已清洗的）目标文件名
    [[nodiscard]] auto resolve(const file_meta& meta) const -> std::string;

private:
    filename_strategy(kind k, custom_fn fn) : kind_(k), fn_(std::move(fn)) {}

    kind kind_;
    custom_fn fn_;
};

// =============================================================================
// disk_options
// =============================================================================

struct disk_options {
    /// 目标目录（不存在则创建）
    std::filesystem::path destination;

    filename_strategy strategy = filename_strategy::random();

    /// 写入前过滤；返回 false → filter_rejected，不产生任何文件
    std::function<bool(const file_meta&)> filter;

    /// 目标已存在时追加随机后缀重试的次数
    std::size_t collision_retries = 8;
};

// =============================================================================
// disk_storage
// =============================================================================

class disk_storage : public storage_engine {
    struct private_tag { explicit private_tag() = default; };

public:
    /// 仅供 create() 经 make_shared 调用
    disk_storage(private_tag, disk_options options) : options_(std::move(options)) {}

    /// 创建目录并探测可写性；失败 → destination_unwritable（cause 为 OS 错误）
    [[nodiscard]] static auto create(disk_options options)
        -> std::expected<std::shared_ptr<disk_storage>, upload_error>;

    auto commit(const file_meta& meta, part_reader& reader)
        -> task<std::expected<stored_file, upload_error>> override;

    auto cleanup(const stored_file& file)
        -> std::expected<void, std::error_code> override;

    auto retrieve(const stored_file& file) const
        -> std::expected<std::vector<std::byte>, std::error_code> override;

    [[nodiscard]] auto destination() const noexcept -> const std::filesystem::path& {
        return options_.destination;
    }

private:
    disk_options options_;
};

} // namespace formflow
