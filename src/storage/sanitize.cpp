#include <formflow/config.hpp>
#include <formflow/storage/sanitize.hpp>
#include <formflow/multipart/header_values.hpp>

#include <fmt/format.h>

#include <array>
#include <random>

namespace formflow {

namespace {

inline auto is_forbidden(unsigned char c) noexcept -> bool {
    if (c < 0x20 || c == 0x7f) return true;
    switch (c) {
        case '/': case '\\': case '<': case '>': case ':':
        case '"': case '|':  case '?': case '*':
            return true;
        default:
            return false;
    }
}

inline auto is_trailing_junk(char c) noexcept -> bool {
    return c == '.' || c == ' ';
}

/// CON / PRN / AUX / NUL / COM1-9 / LPT1-9（与扩展名无关）
auto is_device_name(std::string_view name) noexcept -> bool {
    auto stem = name.substr(0, name.find('.'));
    while (!stem.empty() && stem.back() == ' ') stem.remove_suffix(1);

    constexpr std::array<std::string_view, 4> plain{"CON", "PRN", "AUX", "NUL"};
    for (auto d : plain) {
        if (multipart::detail::iequals(stem, d)) return true;
    }
    if (stem.size() == 4 && stem[3] >= '1' && stem[3] <= '9') {
        auto head = stem.substr(0, 3);
        if (multipart::detail::iequals(head, "COM") || multipart::detail::iequals(head, "LPT"))
            return true;
    }
    return false;
}

void strip_trailing(std::string& s) {
    while (!s.empty() && is_trailing_junk(s.back())) s.pop_back();
}

/// 截断到 max 字节，不拆开 UTF-8 多字节序列
auto utf8_prefix(std::string_view s, std::size_t max) noexcept -> std::string_view {
    if (s.size() <= max) return s;
    auto cut = max;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

} // namespace

auto fnv1a64(std::string_view data) noexcept -> std::uint64_t {
    std::uint64_t h = 0xcbf29ce484222325ull;
    for (auto c : data) {
        h ^= static_cast<unsigned char>(c);
        h *= 0x100000001b3ull;
    }
    return h;
}

auto file_extension(std::string_view name) -> std::string_view {
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return {};
    return name.substr(dot);
}

auto sanitize_filename(std::string_view name) -> std::string {
    // 1. 替换非法字符，同时折叠连续的 '.'
    std::string out;
    out.reserve(name.size());
    for (auto ch : name) {
        auto c = static_cast<unsigned char>(ch);
        char next = is_forbidden(c) ? '_' : ch;
        if (next == '.' && !out.empty() && out.back() == '.') continue;
        out += next;
    }

    // 2. 去掉开头的 '.'，结尾的 '.' 与空格
    auto first = out.find_first_not_of('.');
    out.erase(0, first == std::string::npos ? out.size() : first);
    strip_trailing(out);

    // 3. Windows 保留设备名
    if (!out.empty() && is_device_name(out))
        out.insert(out.begin(), '_');

    // 4. 长度上限，保留扩展名
    constexpr std::size_t max_len = FORMFLOW_MAX_FILENAME_LENGTH;
    if (out.size() > max_len) {
        auto ext = file_extension(out);
        if (ext.size() > max_len / 4) ext = {};   // 过长的“扩展名”不保留
        std::string e{ext};
        std::string stem{utf8_prefix(std::string_view(out).substr(0, out.size() - e.size()),
                                     max_len - e.size())};
        strip_trailing(stem);
        out = stem.empty() ? std::string{utf8_prefix(out, max_len)} : stem + e;
        strip_trailing(out);
    }

    // 5. 兜底名称
    if (out.empty())
        out = fmt::format("upload-{:016x}", fnv1a64(name));

    return out;
}

auto random_identifier() -> std::string {
    thread_local std::mt19937_64 rng = [] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        return std::mt19937_64{seq};
    }();
    auto hi = rng();
    auto lo = rng();
    return fmt::format("{:016x}{:016x}", hi, lo);
}

} // namespace formflow
