#include <formflow/upload/source.hpp>

#include <algorithm>
#include <utility>

namespace formflow {

// =============================================================================
// memory_chunk_source
// =============================================================================

auto memory_chunk_source::split(std::string_view payload, std::size_t chunk_size)
    -> std::vector<byte_chunk>
{
    if (chunk_size == 0) chunk_size = 1;

    std::vector<byte_chunk> out;
    out.reserve(payload.size() / chunk_size + 1);
    for (std::size_t pos = 0; pos < payload.size(); pos += chunk_size)
        out.push_back(to_chunk(payload.substr(pos, chunk_size)));
    return out;
}

auto memory_chunk_source::from_string(std::string_view payload, std::size_t chunk_size)
    -> memory_chunk_source
{
    return memory_chunk_source{split(payload, chunk_size)};
}

auto memory_chunk_source::next() -> task<result_type> {
    auto index = pos_;
    if (index >= chunks_.size() && !(fail_index_ && *fail_index_ == index))
        co_return std::optional<byte_chunk>{};

    ++pos_;
    if (fail_index_ && *fail_index_ == index)
        co_return std::unexpected(fail_code_);

    co_return std::optional<byte_chunk>{std::move(chunks_[index])};
}

// =============================================================================
// queue_chunk_source
// =============================================================================

queue_chunk_source::next_awaiter::~next_awaiter() {
    // 帧被销毁时不留下悬挂的等待者
    if (self && q.waiter_ == self)
        q.waiter_ = {};
}

auto queue_chunk_source::next_awaiter::await_resume() -> result_type {
    self = {};
    if (q.items_.empty())
        return std::optional<byte_chunk>{};   // closed

    auto front = std::move(q.items_.front());
    q.items_.pop_front();
    if (!front)
        return std::unexpected(front.error());
    return std::optional<byte_chunk>{std::move(*front)};
}

void queue_chunk_source::wake() {
    if (auto h = std::exchange(waiter_, {}))
        h.resume();
}

void queue_chunk_source::push(byte_chunk chunk) {
    if (closed_) return;
    items_.emplace_back(std::move(chunk));
    wake();
}

void queue_chunk_source::push_error(std::error_code ec) {
    if (closed_) return;
    items_.emplace_back(std::unexpected(ec));
    wake();
}

void queue_chunk_source::close() {
    closed_ = true;
    wake();
}

auto queue_chunk_source::next() -> task<result_type> {
    next_awaiter aw{*this};
    auto r = co_await aw;
    co_return r;
}

} // namespace formflow
