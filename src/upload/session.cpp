#include <formflow/upload/session.hpp>
#include <formflow/core/buffer.hpp>
#include <formflow/core/log.hpp>

#include <optional>
#include <span>
#include <utility>

namespace formflow {

auto to_string(session_state s) noexcept -> std::string_view {
    switch (s) {
        case session_state::idle:      return "idle";
        case session_state::parsing:   return "parsing";
        case session_state::completed: return "completed";
        case session_state::aborted:   return "aborted";
    }
    return "unknown";
}

// =============================================================================
// body_reader — 把当前 part 的 part_data 事件交给存储引擎
// =============================================================================

class parse_session::body_reader : public part_reader {
public:
    /// counted = false 时不计入 part 限制（被忽略的 part）
    body_reader(parse_session& session, bool counted) noexcept
        : session_(session), counted_(counted) {}

    auto next_chunk() -> task<chunk_result> override;

    [[nodiscard]] auto finished() const noexcept -> bool { return finished_; }

    /// reader 自身报告过的错误（优先于引擎返回的错误）
    [[nodiscard]] auto failure() const noexcept -> const std::optional<upload_error>& {
        return failure_;
    }

private:
    auto fail(upload_error err) -> std::unexpected<upload_error> {
        failure_ = err;
        return std::unexpected(std::move(err));
    }

    parse_session& session_;
    bool counted_;
    bool finished_ = false;
    std::optional<upload_error> failure_;
};

auto parse_session::body_reader::next_chunk() -> task<chunk_result> {
    using chunk = std::optional<std::span<const std::byte>>;

    if (finished_)
        co_return chunk{};
    if (failure_)
        co_return std::unexpected(*failure_);

    auto pull = session_.next_event();
    auto ev = co_await pull;
    if (!ev)
        co_return fail(std::move(ev.error()));

    switch (ev->kind) {
        case multipart::scan_event_kind::part_data: {
            if (counted_) {
                auto ok = session_.limits_.on_part_data(ev->data.size());
                if (!ok)
                    co_return fail(std::move(ok.error()));
            }
            co_return chunk{ev->data};
        }
        case multipart::scan_event_kind::part_end:
            finished_ = true;
            co_return chunk{};
        default:
            co_return fail(make_upload_error(errc::malformed_boundary, session_.current_field_));
    }
}

namespace {

/// 读完当前 part 并丢弃内容
auto drain(part_reader& reader) -> task<std::expected<void, upload_error>> {
    for (;;) {
        auto pull = reader.next_chunk();
        auto r = co_await pull;
        if (!r)
            co_return std::unexpected(std::move(r.error()));
        if (!*r)
            co_return std::expected<void, upload_error>{};
    }
}

} // namespace

// =============================================================================
// parse_session
// =============================================================================

parse_session::parse_session(std::shared_ptr<const upload_config> config,
                             std::shared_ptr<storage_engine> storage,
                             std::string boundary,
                             chunk_source& source,
                             cancel_token* token)
    : config_(std::move(config))
    , storage_(std::move(storage))
    , boundary_(std::move(boundary))
    , source_(source)
    , token_(token)
    , scanner_(boundary_, config_->limits.max_header_size)
    , selector_(config_->rules, config_->policy)
    , limits_(config_->limits)
{}

parse_session::~parse_session() {
    // 调用方放弃了请求（协程帧被销毁）
    if (!committed_.empty()) {
        logger::warn("upload session abandoned, removing {} stored file(s)", committed_.size());
        rollback();
    }
}

auto parse_session::check_cancelled() const -> std::expected<void, upload_error> {
    if (token_ && token_->is_cancelled())
        return std::unexpected(make_upload_error(errc::cancelled, current_field_));
    return {};
}

auto parse_session::rollback() -> std::vector<std::error_code> {
    std::vector<std::error_code> failures;
    for (auto& f : committed_) {
        auto r = storage_->cleanup(f);
        if (!r) {
            logger::error("cleanup of '{}' (field '{}') failed: {}",
                          f.storage_key, f.field_name, r.error().message());
            failures.push_back(r.error());
        }
    }
    committed_.clear();
    return failures;
}

auto parse_session::abort(upload_error err) -> std::unexpected<upload_error> {
    state_ = session_state::aborted;
    auto failures = rollback();
    err.cleanup_failures.insert(err.cleanup_failures.end(), failures.begin(), failures.end());
    logger::warn("upload session aborted ({}): {}", to_string(err.kind()), err.message());
    return std::unexpected(std::move(err));
}

auto parse_session::pull_chunk() -> task<std::expected<void, upload_error>> {
    if (auto c = check_cancelled(); !c)
        co_return std::unexpected(std::move(c.error()));

    auto next = source_.next();
    auto r = co_await next;

    if (auto c = check_cancelled(); !c)
        co_return std::unexpected(std::move(c.error()));

    if (!r) {
        auto err = make_upload_error(errc::body_stream_failed, current_field_);
        err.cause = r.error();
        co_return std::unexpected(std::move(err));
    }

    if (!*r) {
        eof_ = true;
        scanner_.finish();
        co_return std::expected<void, upload_error>{};
    }

    auto& data = **r;
    auto counted = limits_.on_body_chunk(data.size());
    if (!counted)
        co_return std::unexpected(std::move(counted.error()));

    scanner_.feed(data);
    co_return std::expected<void, upload_error>{};
}

auto parse_session::next_event()
    -> task<std::expected<multipart::scan_event, upload_error>>
{
    for (;;) {
        auto ev = scanner_.next_event();
        if (!ev) {
            auto err = wrap_error(ev.error(), current_field_);
            if (err.is(errc::header_too_large))
                err.limit = config_->limits.max_header_size;
            co_return std::unexpected(std::move(err));
        }
        if (*ev)
            co_return std::move(**ev);

        if (eof_)
            co_return std::unexpected(make_upload_error(errc::unexpected_eof, current_field_));

        auto pulled = pull_chunk();
        auto r = co_await pulled;
        if (!r)
            co_return std::unexpected(std::move(r.error()));
    }
}

auto parse_session::handle_part(std::string header_block)
    -> task<std::expected<void, upload_error>>
{
    auto info = multipart::parse_part_headers(header_block);
    if (!info)
        co_return std::unexpected(wrap_error(info.error()));

    current_field_ = info->field_name;

    auto sel = selector_.select(info->field_name, info->is_file());
    if (!sel)
        co_return std::unexpected(std::move(sel.error()));

    if (sel->action == selector_action::ignore) {
        logger::debug("ignoring file part for unknown field '{}'", info->field_name);
        body_reader skipped{*this, false};
        auto drained = drain(skipped);
        auto d = co_await drained;
        if (!d)
            co_return std::unexpected(std::move(d.error()));
        current_field_.clear();
        co_return std::expected<void, upload_error>{};
    }

    auto begun = limits_.begin_part(info->field_name, info->is_file(),
                                    info->content_type, sel->rule);
    if (!begun)
        co_return std::unexpected(std::move(begun.error()));

    body_reader reader{*this, true};

    if (info->is_file()) {
        file_meta meta;
        meta.field_name = info->field_name;
        meta.file_name = info->file_name;
        meta.content_type = info->content_type;
        meta.index = file_index_++;

        logger::debug("accepted file part '{}' ({}, {})",
                      meta.field_name, meta.file_name.value_or(""), meta.content_type);

        auto commit = storage_->commit(meta, reader);
        auto stored = co_await commit;
        if (!stored) {
            auto err = reader.failure() ? *reader.failure() : std::move(stored.error());
            if (err.field.empty()) err.field = meta.field_name;
            co_return std::unexpected(std::move(err));
        }
        committed_.push_back(std::move(*stored));

        // 引擎提前返回时读完剩余内容，保证扫描位置正确
        if (!reader.finished()) {
            auto drained = drain(reader);
            auto d = co_await drained;
            if (!d)
                co_return std::unexpected(std::move(d.error()));
        }
    } else {
        std::string value;
        for (;;) {
            auto pull = reader.next_chunk();
            auto c = co_await pull;
            if (!c)
                co_return std::unexpected(std::move(c.error()));
            if (!*c)
                break;
            value.append(as_string_view(**c));
        }
        logger::debug("accepted field '{}' ({} bytes)", info->field_name, value.size());
        result_.add_field(form_field{info->field_name, std::move(value)});
    }

    limits_.end_part();
    current_field_.clear();
    co_return std::expected<void, upload_error>{};
}

auto parse_session::run() -> task<std::expected<parse_result, upload_error>> {
    state_ = session_state::parsing;
    logger::debug("upload session started, boundary '{}'", boundary_);

    if (auto c = check_cancelled(); !c)
        co_return abort(std::move(c.error()));

    for (;;) {
        auto next = next_event();
        auto ev = co_await next;
        if (!ev)
            co_return abort(std::move(ev.error()));

        if (ev->kind == multipart::scan_event_kind::stream_end) {
            auto fin = selector_.finish();
            if (!fin)
                co_return abort(std::move(fin.error()));

            for (auto& f : committed_)
                result_.add_file(std::move(f));
            committed_.clear();

            state_ = session_state::completed;
            logger::info("upload session completed: {} file(s), {} field(s), {} bytes",
                         result_.file_count(), result_.field_count(), limits_.body_bytes());
            co_return std::move(result_);
        }

        if (ev->kind != multipart::scan_event_kind::part_begin)
            co_return abort(make_upload_error(errc::malformed_boundary, current_field_));

        auto handled = handle_part(std::move(ev->headers));
        auto r = co_await handled;
        if (!r)
            co_return abort(std::move(r.error()));
    }
}

} // namespace formflow
