#pragma once

#include <atomic>

namespace formflow {

// =============================================================================
// cancel_token — 上传会话取消句柄
// =============================================================================

/// 可取消的解析会话句柄
/// 用法：
///   cancel_token token;
///   auto t = up.parse(content_type, source, &token);
///   // 另一个协程或线程中：
///   token.cancel();  // 请求取消
///
/// 会话在每次拉取分块前后检查 token，命中即以 errc::cancelled 中止并清理
/// 注意：cancel_token 不可复制/移动（会话持有指向 token 的指针），可通过 reset() 复用
class cancel_token {
public:
    cancel_token() = default;
    ~cancel_token() = default;

    cancel_token(const cancel_token&) = delete;
    cancel_token& operator=(const cancel_token&) = delete;

    /// 请求取消。线程安全，可从任意线程调用，多次调用安全
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    /// 是否已请求取消
    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// 重置 token（复用于下一个会话）
    /// 前提：当前没有使用该 token 的会话
    void reset() noexcept {
        cancelled_.store(false, std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace formflow
