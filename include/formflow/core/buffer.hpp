#pragma once

#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace formflow {

// =============================================================================
// 字节块
// =============================================================================

/// 请求体的一个分块（由 chunk_source 产出，所有权随值转移）
using byte_chunk = std::vector<std::byte>;

/// 从 string_view 拷贝出字节块
inline auto to_chunk(std::string_view sv) -> byte_chunk {
    byte_chunk out(sv.size());
    if (!sv.empty())
        std::memcpy(out.data(), sv.data(), sv.size());
    return out;
}

/// 字节视图 → string_view（不拷贝）
inline auto as_string_view(std::span<const std::byte> s) noexcept
    -> std::string_view
{
    return {reinterpret_cast<const char*>(s.data()), s.size()};
}

/// string_view → 只读字节视图（不拷贝）
inline auto as_bytes(std::string_view sv) noexcept
    -> std::span<const std::byte>
{
    return {reinterpret_cast<const std::byte*>(sv.data()), sv.size()};
}

/// 字节视图 → std::string（拷贝）
inline auto to_string(std::span<const std::byte> s) -> std::string {
    return std::string{as_string_view(s)};
}

} // namespace formflow
