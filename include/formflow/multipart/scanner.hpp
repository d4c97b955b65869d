#pragma once

#include <formflow/config.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace formflow::multipart {

// =============================================================================
// scan_event
// =============================================================================

enum class scan_event_kind {
    part_begin,   // headers 为该 part 的 header 块（不含结尾空行）
    part_data,    // data 指向扫描器内部缓冲，下一次 feed() 前有效
    part_end,
    stream_end,   // 终止 boundary，之后的 epilogue 被忽略
};

struct scan_event {
    scan_event_kind kind = scan_event_kind::part_end;
    std::string headers;
    std::span<const std::byte> data;
};

// =============================================================================
// boundary_scanner — 流式 boundary 切分
// =============================================================================

/// 把任意切分的字节流切成 part 事件序列
///
/// 用法：
///   boundary_scanner sc{"abc"};
///   sc.feed(chunk);
///   while (auto ev = sc.next_event()) {   // expected
///       if (!*ev) break;                  // nullopt: 需要更多输入
///       ...
///   }
///   sc.finish();                          // 上游结束
///
/// 事件序列与输入如何分块无关（part_data 的切分粒度除外）
/// 处于 part body 时，两次 feed 之间最多保留 delimiter 长度 - 1 字节
class boundary_scanner {
public:
    explicit boundary_scanner(std::string_view boundary,
                              std::size_t max_header_size = FORMFLOW_DEFAULT_MAX_HEADER_SIZE);

    /// 追加输入；之前 part_data 事件给出的 span 失效
    void feed(std::span<const std::byte> chunk);

    /// 标记输入结束
    void finish() noexcept { eof_ = true; }

    /// 取下一个事件；nullopt 表示需要更多输入（或已结束）
    /// 错误：malformed_boundary / header_too_large / unexpected_eof
    [[nodiscard]] auto next_event()
        -> std::expected<std::optional<scan_event>, std::error_code>;

    [[nodiscard]] auto done() const noexcept -> bool { return state_ == state::done; }

    /// 当前保留的未消费字节数
    [[nodiscard]] auto buffered() const noexcept -> std::size_t {
        return buf_.size() - pos_;
    }

    [[nodiscard]] auto delimiter_size() const noexcept -> std::size_t {
        return delimiter_.size();
    }

private:
    enum class state {
        preamble,         // 期待首个 "--boundary"
        after_boundary,   // boundary 之后："--" 或行尾
        line_end,         // transport padding + CRLF
        headers,
        body,
        done,
        failed,
    };

    auto fail(std::error_code ec) -> std::unexpected<std::error_code>;

    /// body 中可以安全交付的字节数（剩余部分可能是 delimiter 的前缀）
    [[nodiscard]] auto safe_body_length(std::string_view avail) const noexcept
        -> std::size_t;

    std::string dash_boundary_;   // "--" + boundary
    std::string delimiter_;       // "\r\n--" + boundary
    std::size_t max_header_size_;

    std::string buf_;
    std::size_t pos_ = 0;
    bool eof_ = false;
    state state_ = state::preamble;
    std::error_code error_;
};

} // namespace formflow::multipart
