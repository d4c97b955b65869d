#pragma once

#include <formflow/storage/storage.hpp>

#include <cstdint>
#include <optional>

namespace formflow {

/// 内存存储：每个文件一份只读共享缓冲，跨会话无状态
class memory_storage : public storage_engine {
public:
    /// max_buffer_size: 单个文件缓冲上限（未设置 = 只受会话限制约束）
    explicit memory_storage(std::optional<std::uint64_t> max_buffer_size = std::nullopt) noexcept
        : max_buffer_size_(max_buffer_size) {}

    auto commit(const file_meta& meta, part_reader& reader)
        -> task<std::expected<stored_file, upload_error>> override;

    /// 缓冲随最后一个 stored_file 副本释放，这里无事可做
    auto cleanup(const stored_file& file)
        -> std::expected<void, std::error_code> override;

    auto retrieve(const stored_file& file) const
        -> std::expected<std::vector<std::byte>, std::error_code> override;

private:
    std::optional<std::uint64_t> max_buffer_size_;
};

} // namespace formflow
