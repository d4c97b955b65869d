#pragma once

#include <formflow/core/buffer.hpp>
#include <formflow/coro/task.hpp>

#include <coroutine>
#include <cstddef>
#include <deque>
#include <expected>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace formflow {

// =============================================================================
// chunk_source — 请求体分块来源
// =============================================================================

/// 请求体的异步分块序列
/// next() 返回：
///   - 一个分块
///   - std::nullopt 表示流结束
///   - error_code 表示该分块读取失败（会话以 body_stream_failed 中止）
class chunk_source {
public:
    using result_type = std::expected<std::optional<byte_chunk>, std::error_code>;

    virtual ~chunk_source() = default;

    virtual auto next() -> task<result_type> = 0;
};

// =============================================================================
// memory_chunk_source — 预先切好的分块
// =============================================================================

class memory_chunk_source : public chunk_source {
public:
    explicit memory_chunk_source(std::vector<byte_chunk> chunks)
        : chunks_(std::move(chunks)) {}

    /// 按 chunk_size 切分 payload（chunk_size 为 0 时视为 1）
    [[nodiscard]] static auto split(std::string_view payload, std::size_t chunk_size)
        -> std::vector<byte_chunk>;

    /// 便捷构造：payload 按 chunk_size 切分
    [[nodiscard]] static auto from_string(std::string_view payload,
                                          std::size_t chunk_size = 64 * 1024)
        -> memory_chunk_source;

    /// 第 index 次拉取返回 ec 而不是分块
    void fail_at(std::size_t index, std::error_code ec) {
        fail_index_ = index;
        fail_code_ = ec;
    }

    auto next() -> task<result_type> override;

    /// 已拉取次数（含失败的一次）
    [[nodiscard]] auto pulled() const noexcept -> std::size_t { return pos_; }

private:
    std::vector<byte_chunk> chunks_;
    std::size_t pos_ = 0;
    std::optional<std::size_t> fail_index_;
    std::error_code fail_code_;
};

// =============================================================================
// queue_chunk_source — 生产者推送，消费者挂起等待
// =============================================================================

/// 单线程协作式交接：队列为空时 next() 挂起，
/// push / push_error / close 在生产者调用栈上直接恢复等待中的消费者
class queue_chunk_source : public chunk_source {
public:
    queue_chunk_source() = default;
    queue_chunk_source(const queue_chunk_source&) = delete;
    auto operator=(const queue_chunk_source&) -> queue_chunk_source& = delete;

    void push(byte_chunk chunk);
    void push(std::string_view data) { push(to_chunk(data)); }
    void push_error(std::error_code ec);
    void close();

    auto next() -> task<result_type> override;

    /// 是否有消费者挂起等待
    [[nodiscard]] auto has_waiter() const noexcept -> bool {
        return static_cast<bool>(waiter_);
    }

    [[nodiscard]] auto is_closed() const noexcept -> bool { return closed_; }

private:
    using item = std::expected<byte_chunk, std::error_code>;

    struct next_awaiter {
        queue_chunk_source& q;
        std::coroutine_handle<> self{};

        ~next_awaiter();

        auto await_ready() const noexcept -> bool {
            return !q.items_.empty() || q.closed_;
        }
        void await_suspend(std::coroutine_handle<> h) noexcept {
            self = h;
            q.waiter_ = h;
        }
        auto await_resume() -> result_type;
    };

    void wake();

    std::deque<item> items_;
    bool closed_ = false;
    std::coroutine_handle<> waiter_{};
};

} // namespace formflow
