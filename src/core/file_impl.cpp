#include <formflow/config.hpp>
#include <formflow/core/file.hpp>
#include <formflow/core/error.hpp>

#ifdef FORMFLOW_PLATFORM_WINDOWS
#include <Windows.h>
#else
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#endif

#include <utility>

namespace formflow {

namespace {

#ifdef FORMFLOW_PLATFORM_WINDOWS
auto last_error() -> std::error_code {
    return {static_cast<int>(::GetLastError()), std::system_category()};
}
#else
auto last_error() -> std::error_code {
    return {errno, std::generic_category()};
}
#endif

} // namespace

file::~file() {
    close();
}

file::file(file&& other) noexcept
    : handle_(std::exchange(other.handle_, invalid_file_handle)) {}

auto file::operator=(file&& other) noexcept -> file& {
    if (this != &other) {
        close();
        handle_ = std::exchange(other.handle_, invalid_file_handle);
    }
    return *this;
}

// =============================================================================
// Open
// =============================================================================

auto file::open(const std::filesystem::path& path, open_mode mode)
    -> std::expected<file, std::error_code>
{
#ifdef FORMFLOW_PLATFORM_WINDOWS
    // --- Access permissions ---
    DWORD access = 0;
    if (has_flag(mode, open_mode::read))
        access |= GENERIC_READ;
    if (has_flag(mode, open_mode::write))
        access |= GENERIC_WRITE;

    // --- Creation disposition ---
    DWORD disposition = OPEN_EXISTING;
    if (has_flag(mode, open_mode::create_new))
        disposition = CREATE_NEW;
    else if (has_flag(mode, open_mode::truncate) && has_flag(mode, open_mode::create))
        disposition = CREATE_ALWAYS;
    else if (has_flag(mode, open_mode::create))
        disposition = OPEN_ALWAYS;
    else if (has_flag(mode, open_mode::truncate))
        disposition = TRUNCATE_EXISTING;

    HANDLE h = ::CreateFileW(path.c_str(), access, FILE_SHARE_READ, nullptr,
                             disposition, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
        return std::unexpected(last_error());

    return file{h};

#else
    int flags = O_CLOEXEC;
    if (has_flag(mode, open_mode::read_write))
        flags |= O_RDWR;
    else if (has_flag(mode, open_mode::write))
        flags |= O_WRONLY;
    else
        flags |= O_RDONLY;

    if (has_flag(mode, open_mode::create))   flags |= O_CREAT;
    if (has_flag(mode, open_mode::truncate)) flags |= O_TRUNC;
    if (has_flag(mode, open_mode::create_new))
        flags |= (O_CREAT | O_EXCL);

    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0)
        return std::unexpected(last_error());

    return file{fd};
#endif
}

auto file::remove(const std::filesystem::path& path)
    -> std::expected<void, std::error_code>
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec)
        return std::unexpected(ec);
    return {};
}

// =============================================================================
// Close
// =============================================================================

void file::close() noexcept {
    if (handle_ == invalid_file_handle) return;
#ifdef FORMFLOW_PLATFORM_WINDOWS
    ::CloseHandle(handle_);
#else
    ::close(handle_);
#endif
    handle_ = invalid_file_handle;
}

// =============================================================================
// Read / Write
// =============================================================================

auto file::write_all(std::span<const std::byte> data)
    -> std::expected<void, std::error_code>
{
    if (!is_open())
        return std::unexpected(make_error_code(errc::io_error));

    while (!data.empty()) {
#ifdef FORMFLOW_PLATFORM_WINDOWS
        DWORD written = 0;
        auto want = static_cast<DWORD>(
            data.size() > 0x40000000u ? 0x40000000u : data.size());
        if (!::WriteFile(handle_, data.data(), want, &written, nullptr))
            return std::unexpected(last_error());
        data = data.subspan(written);
#else
        auto n = ::write(handle_, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(last_error());
        }
        data = data.subspan(static_cast<std::size_t>(n));
#endif
    }
    return {};
}

auto file::read_some(std::span<std::byte> buf)
    -> std::expected<std::size_t, std::error_code>
{
    if (!is_open())
        return std::unexpected(make_error_code(errc::io_error));

#ifdef FORMFLOW_PLATFORM_WINDOWS
    DWORD got = 0;
    auto want = static_cast<DWORD>(
        buf.size() > 0x40000000u ? 0x40000000u : buf.size());
    if (!::ReadFile(handle_, buf.data(), want, &got, nullptr))
        return std::unexpected(last_error());
    return static_cast<std::size_t>(got);
#else
    for (;;) {
        auto n = ::read(handle_, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(last_error());
        }
        return static_cast<std::size_t>(n);
    }
#endif
}

auto file::sync() -> std::expected<void, std::error_code> {
#ifdef FORMFLOW_PLATFORM_WINDOWS
    if (!::FlushFileBuffers(handle_))
        return std::unexpected(last_error());
#else
    if (::fsync(handle_) != 0)
        return std::unexpected(last_error());
#endif
    return {};
}

// =============================================================================
// File size
// =============================================================================

auto file::size() const -> std::expected<std::uint64_t, std::error_code> {
#ifdef FORMFLOW_PLATFORM_WINDOWS
    LARGE_INTEGER li{};
    if (!::GetFileSizeEx(handle_, &li))
        return std::unexpected(last_error());
    return static_cast<std::uint64_t>(li.QuadPart);
#else
    struct stat st{};
    if (::fstat(handle_, &st) != 0)
        return std::unexpected(last_error());
    return static_cast<std::uint64_t>(st.st_size);
#endif
}

} // namespace formflow
