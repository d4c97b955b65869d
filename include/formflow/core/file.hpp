#pragma once

#include <formflow/config.hpp>

#ifdef FORMFLOW_PLATFORM_WINDOWS
#include <Windows.h>
#endif

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <system_error>

namespace formflow {

// =============================================================================
// 平台类型别名
// =============================================================================

#ifdef FORMFLOW_PLATFORM_WINDOWS
using file_handle_t = HANDLE;
inline const file_handle_t invalid_file_handle = INVALID_HANDLE_VALUE;
#else
using file_handle_t = int;
inline constexpr file_handle_t invalid_file_handle = -1;
#endif

// =============================================================================
// 文件打开模式
// =============================================================================

enum class open_mode : std::uint32_t {
    read         = 0x01,
    write        = 0x02,
    read_write   = 0x03,
    create       = 0x08,   // 不存在则创建
    truncate     = 0x10,   // 存在则截断
    create_new   = 0x20,   // 必须不存在（上传落盘只用这个）
};

constexpr auto operator|(open_mode a, open_mode b) noexcept -> open_mode {
    return static_cast<open_mode>(
        static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

constexpr auto operator&(open_mode a, open_mode b) noexcept -> open_mode {
    return static_cast<open_mode>(
        static_cast<std::uint32_t>(a) & static_cast<std::uint32_t>(b));
}

constexpr auto has_flag(open_mode mode, open_mode flag) noexcept -> bool {
    return (mode & flag) == flag;
}

// =============================================================================
// File 类
// =============================================================================

/// 平台无关的文件句柄封装（RAII），阻塞 I/O
/// 错误码统一映射到 formflow::errc，原生错误保留在 error_code 的类别里
class file {
public:
    file() noexcept = default;
    ~file();

    // 不可复制
    file(const file&) = delete;
    auto operator=(const file&) -> file& = delete;

    // 可移动
    file(file&& other) noexcept;
    auto operator=(file&& other) noexcept -> file&;

    /// 打开文件
    [[nodiscard]] static auto open(
        const std::filesystem::path& path,
        open_mode mode
    ) -> std::expected<file, std::error_code>;

    /// 删除文件；不存在视为成功
    [[nodiscard]] static auto remove(const std::filesystem::path& path)
        -> std::expected<void, std::error_code>;

    /// 关闭文件
    void close() noexcept;

    /// 写入全部字节（处理短写与 EINTR）
    [[nodiscard]] auto write_all(std::span<const std::byte> data)
        -> std::expected<void, std::error_code>;

    /// 读取至多 buf.size() 字节，返回 0 表示 EOF
    [[nodiscard]] auto read_some(std::span<std::byte> buf)
        -> std::expected<std::size_t, std::error_code>;

    /// 刷到持久存储（fsync / FlushFileBuffers）
    [[nodiscard]] auto sync() -> std::expected<void, std::error_code>;

    /// 获取文件大小
    [[nodiscard]] auto size() const -> std::expected<std::uint64_t, std::error_code>;

    /// 获取原生句柄
    [[nodiscard]] auto native_handle() const noexcept -> file_handle_t {
        return handle_;
    }

    /// 是否有效
    [[nodiscard]] auto is_open() const noexcept -> bool {
        return handle_ != invalid_file_handle;
    }

    explicit operator bool() const noexcept { return is_open(); }

private:
    explicit file(file_handle_t handle) noexcept : handle_(handle) {}

    file_handle_t handle_ = invalid_file_handle;
};

} // namespace formflow
