/**
 * @file uploader.hpp
 * @brief 流式 multipart/form-data 上传入口
 *
 * 使用示例:
 *   auto storage = formflow::disk_storage::create({.destination = "uploads"});
 *   auto up = formflow::uploader::create(cfg, *storage);
 *   if (!up) { ... up.error().message() ... }
 *
 *   // 适配层把请求体包装成 chunk_source，然后：
 *   auto result = co_await up->parse(request.header("Content-Type"), body_source);
 *   if (!result) {
 *       switch (result.error().kind()) {
 *           case formflow::error_kind::limit:  ... 413 ...
 *           case formflow::error_kind::parse:  ... 400 ...
 *           default:                           ... 500 ...
 *       }
 *   }
 *   for (auto& f : result->all_files()) { ... f.path / f.buffer ... }
 */
#pragma once

#include <formflow/core/error.hpp>
#include <formflow/coro/cancel.hpp>
#include <formflow/coro/task.hpp>
#include <formflow/storage/storage.hpp>
#include <formflow/upload/config.hpp>
#include <formflow/upload/result.hpp>
#include <formflow/upload/source.hpp>

#include <expected>
#include <memory>
#include <string>

namespace formflow {

class uploader {
public:
    /// 校验配置并绑定存储引擎；配置错误在此返回，而不是在第一次请求时
    [[nodiscard]] static auto create(upload_config config,
                                     std::shared_ptr<storage_engine> storage)
        -> std::expected<uploader, upload_error>;

    /// 解析一个请求体
    /// content_type 在读取任何字节之前校验；返回的 task 持有配置与引擎的共享引用，
    /// 可以比 uploader 本身活得更久。source 与 token 必须在 task 结束前保持有效
    [[nodiscard]] auto parse(std::string content_type,
                             chunk_source& source,
                             cancel_token* token = nullptr) const
        -> task<std::expected<parse_result, upload_error>>;

    [[nodiscard]] auto config() const noexcept -> const upload_config& { return *config_; }

    [[nodiscard]] auto storage() const noexcept -> const std::shared_ptr<storage_engine>& {
        return storage_;
    }

private:
    uploader(std::shared_ptr<const upload_config> config,
             std::shared_ptr<storage_engine> storage) noexcept
        : config_(std::move(config)), storage_(std::move(storage)) {}

    std::shared_ptr<const upload_config> config_;
    std::shared_ptr<storage_engine> storage_;
};

} // namespace formflow
