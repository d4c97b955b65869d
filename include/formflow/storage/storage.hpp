/**
 * @file storage.hpp
 * @brief 存储引擎接口 — 接收已通过校验的 part 字节并持久化
 *
 * 引擎通过 part_reader 拉取当前 part 的 body，限制检查发生在 reader 内部：
 * next_chunk() 返回错误时引擎必须放弃该 part，并撤销已写入的所有内容。
 *
 * 自定义引擎示例:
 *   class s3_storage : public formflow::storage_engine {
 *   public:
 *       auto commit(const file_meta& meta, part_reader& reader)
 *           -> task<std::expected<stored_file, upload_error>> override;
 *       auto cleanup(const stored_file& f)
 *           -> std::expected<void, std::error_code> override;
 *       auto retrieve(const stored_file& f) const
 *           -> std::expected<std::vector<std::byte>, std::error_code> override;
 *   };
 */
#pragma once

#include <formflow/core/error.hpp>
#include <formflow/coro/task.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace formflow {

// =============================================================================
// file_meta — 交给引擎、命名策略与过滤器的 part 元数据
// =============================================================================

struct file_meta {
    std::string field_name;
    std::optional<std::string> file_name;   // 客户端提供的原始文件名
    std::string content_type;
    std::size_t index = 0;                  // 本会话中的文件序号，从 0 开始
};

// =============================================================================
// stored_file — 提交成功后的存储结果（创建后不可变）
// =============================================================================

struct stored_file {
    std::string field_name;
    std::string original_name;
    std::string sanitized_name;
    std::string content_type;
    std::uint64_t size = 0;

    /// 引擎内的唯一标识（磁盘为文件名，内存为序号）
    std::string storage_key;

    /// 磁盘引擎：落盘路径
    std::optional<std::filesystem::path> path;

    /// 内存引擎：只读共享缓冲
    std::shared_ptr<const std::vector<std::byte>> buffer;

    [[nodiscard]] auto in_memory() const noexcept -> bool {
        return buffer != nullptr;
    }
};

// =============================================================================
// part_reader — 引擎拉取当前 part body 的接口
// =============================================================================

class part_reader {
public:
    using chunk_result =
        std::expected<std::optional<std::span<const std::byte>>, upload_error>;

    virtual ~part_reader() = default;

    /// 返回下一段 body；nullopt 表示该 part 结束
    /// 返回的 span 在下一次调用前有效
    virtual auto next_chunk() -> task<chunk_result> = 0;
};

// =============================================================================
// storage_engine
// =============================================================================

class storage_engine {
public:
    virtual ~storage_engine() = default;

    /// 消费 reader 直到 part 结束并提交
    /// 失败（含 reader 报错、协程帧被销毁）时不得留下任何产物
    virtual auto commit(const file_meta& meta, part_reader& reader)
        -> task<std::expected<stored_file, upload_error>> = 0;

    /// 撤销一个已提交的结果（会话中止时调用）
    virtual auto cleanup(const stored_file& file)
        -> std::expected<void, std::error_code> = 0;

    /// 读回已提交的内容
    virtual auto retrieve(const stored_file& file) const
        -> std::expected<std::vector<std::byte>, std::error_code> = 0;
};

} // namespace formflow
