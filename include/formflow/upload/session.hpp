#pragma once

#include <formflow/core/error.hpp>
#include <formflow/coro/cancel.hpp>
#include <formflow/coro/task.hpp>
#include <formflow/multipart/part_headers.hpp>
#include <formflow/multipart/scanner.hpp>
#include <formflow/storage/storage.hpp>
#include <formflow/upload/config.hpp>
#include <formflow/upload/limits.hpp>
#include <formflow/upload/result.hpp>
#include <formflow/upload/selector.hpp>
#include <formflow/upload/source.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace formflow {

enum class session_state {
    idle,
    parsing,
    completed,
    aborted,
};

[[nodiscard]] auto to_string(session_state s) noexcept -> std::string_view;

/// 一次请求的解析会话：boundary 扫描 → header 解析 → 字段选择 → 限制检查 → 存储
///
/// 会话独占所有计数器；中止时（错误、取消、或协程帧被销毁）
/// 所有已提交的存储结果都会通过引擎 cleanup
class parse_session {
public:
    parse_session(std::shared_ptr<const upload_config> config,
                  std::shared_ptr<storage_engine> storage,
                  std::string boundary,
                  chunk_source& source,
                  cancel_token* token = nullptr);

    ~parse_session();

    parse_session(const parse_session&) = delete;
    auto operator=(const parse_session&) -> parse_session& = delete;

    /// 运行到 Completed 或 Aborted；只能调用一次
    [[nodiscard]] auto run() -> task<std::expected<parse_result, upload_error>>;

    [[nodiscard]] auto state() const noexcept -> session_state { return state_; }

    /// 已计入的原始请求体字节数
    [[nodiscard]] auto body_bytes() const noexcept -> std::uint64_t {
        return limits_.body_bytes();
    }

private:
    class body_reader;
    friend class body_reader;

    /// 下一个扫描事件，按需从 source 拉取分块
    [[nodiscard]] auto next_event() -> task<std::expected<multipart::scan_event, upload_error>>;

    /// 拉取一个分块并送入扫描器
    [[nodiscard]] auto pull_chunk() -> task<std::expected<void, upload_error>>;

    [[nodiscard]] auto handle_part(std::string header_block)
        -> task<std::expected<void, upload_error>>;

    [[nodiscard]] auto check_cancelled() const -> std::expected<void, upload_error>;

    auto abort(upload_error err) -> std::unexpected<upload_error>;

    /// 撤销所有已提交文件，返回失败的 cleanup
    auto rollback() -> std::vector<std::error_code>;

    std::shared_ptr<const upload_config> config_;
    std::shared_ptr<storage_engine> storage_;
    std::string boundary_;
    chunk_source& source_;
    cancel_token* token_;

    multipart::boundary_scanner scanner_;
    selector_engine selector_;
    limit_enforcer limits_;

    session_state state_ = session_state::idle;
    bool eof_ = false;
    std::size_t file_index_ = 0;
    std::string current_field_;

    parse_result result_;
    std::vector<stored_file> committed_;   // 成功前由会话负责清理
};

} // namespace formflow
