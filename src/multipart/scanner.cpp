#include <formflow/multipart/scanner.hpp>
#include <formflow/core/buffer.hpp>
#include <formflow/core/error.hpp>

#include <algorithm>

namespace formflow::multipart {

boundary_scanner::boundary_scanner(std::string_view boundary, std::size_t max_header_size)
    : dash_boundary_("--" + std::string(boundary))
    , delimiter_("\r\n--" + std::string(boundary))
    , max_header_size_(max_header_size)
{}

void boundary_scanner::feed(std::span<const std::byte> chunk) {
    if (state_ == state::done || state_ == state::failed) return;

    // 压缩已消费部分
    if (pos_ > 0) {
        buf_.erase(0, pos_);
        pos_ = 0;
    }
    buf_.append(as_string_view(chunk));
}

auto boundary_scanner::fail(std::error_code ec) -> std::unexpected<std::error_code> {
    state_ = state::failed;
    error_ = ec;
    return std::unexpected(ec);
}

auto boundary_scanner::safe_body_length(std::string_view avail) const noexcept
    -> std::size_t
{
    auto keep = std::min(avail.size(), delimiter_.size() - 1);
    auto start = avail.size() - keep;
    // 从最早的可能起点开始，找第一个能成为 delimiter 前缀的尾部
    for (auto i = start; i < avail.size(); ++i) {
        auto tail = avail.substr(i);
        if (std::string_view(delimiter_).substr(0, tail.size()) == tail)
            return i;
    }
    return avail.size();
}

auto boundary_scanner::next_event()
    -> std::expected<std::optional<scan_event>, std::error_code>
{
    for (;;) {
        auto avail = std::string_view(buf_).substr(pos_);

        switch (state_) {
        case state::failed:
            return std::unexpected(error_);

        case state::done:
            // epilogue
            pos_ = buf_.size();
            return std::optional<scan_event>{};

        case state::preamble: {
            std::string_view expect = dash_boundary_;
            auto n = std::min(avail.size(), expect.size());
            if (avail.substr(0, n) != expect.substr(0, n))
                return fail(make_error_code(errc::malformed_boundary));
            if (n < expect.size()) {
                if (eof_) return fail(make_error_code(errc::unexpected_eof));
                return std::optional<scan_event>{};
            }
            pos_ += expect.size();
            state_ = state::after_boundary;
            continue;
        }

        case state::after_boundary: {
            if (avail.empty() || (avail.size() == 1 && avail[0] == '-')) {
                if (eof_) return fail(make_error_code(errc::unexpected_eof));
                return std::optional<scan_event>{};
            }
            if (avail[0] == '-') {
                if (avail[1] != '-')
                    return fail(make_error_code(errc::malformed_boundary));
                pos_ += 2;
                state_ = state::done;
                return scan_event{scan_event_kind::stream_end, {}, {}};
            }
            state_ = state::line_end;
            continue;
        }

        case state::line_end: {
            // transport-padding
            std::size_t i = 0;
            while (i < avail.size() && (avail[i] == ' ' || avail[i] == '\t'))
                ++i;
            pos_ += i;
            avail.remove_prefix(i);

            if (avail.empty() || (avail.size() == 1 && avail[0] == '\r')) {
                if (eof_) return fail(make_error_code(errc::unexpected_eof));
                return std::optional<scan_event>{};
            }
            if (avail[0] != '\r' || avail[1] != '\n')
                return fail(make_error_code(errc::malformed_boundary));
            pos_ += 2;
            state_ = state::headers;
            continue;
        }

        case state::headers: {
            // 空 header 块：boundary 行后紧跟空行
            if (avail.size() >= 2 && avail[0] == '\r' && avail[1] == '\n') {
                pos_ += 2;
                state_ = state::body;
                return scan_event{scan_event_kind::part_begin, {}, {}};
            }

            auto end = avail.find("\r\n\r\n");
            if (end == std::string_view::npos) {
                if (avail.size() >= max_header_size_ + 4)
                    return fail(make_error_code(errc::header_too_large));
                if (eof_) return fail(make_error_code(errc::unexpected_eof));
                return std::optional<scan_event>{};
            }
            if (end > max_header_size_)
                return fail(make_error_code(errc::header_too_large));

            scan_event ev{scan_event_kind::part_begin, std::string(avail.substr(0, end)), {}};
            pos_ += end + 4;
            state_ = state::body;
            return ev;
        }

        case state::body: {
            auto it = std::search(avail.begin(), avail.end(),
                                  delimiter_.begin(), delimiter_.end());
            if (it != avail.end()) {
                auto k = static_cast<std::size_t>(it - avail.begin());
                if (k > 0) {
                    pos_ += k;
                    return scan_event{scan_event_kind::part_data, {},
                                      as_bytes(avail.substr(0, k))};
                }
                pos_ += delimiter_.size();
                state_ = state::after_boundary;
                return scan_event{scan_event_kind::part_end, {}, {}};
            }

            auto safe = safe_body_length(avail);
            if (safe > 0) {
                pos_ += safe;
                return scan_event{scan_event_kind::part_data, {},
                                  as_bytes(avail.substr(0, safe))};
            }
            if (eof_) return fail(make_error_code(errc::unexpected_eof));
            return std::optional<scan_event>{};
        }
        }
    }
}

} // namespace formflow::multipart
