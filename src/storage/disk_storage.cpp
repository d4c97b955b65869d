#include <formflow/config.hpp>
#include <formflow/storage/disk_storage.hpp>
#include <formflow/storage/sanitize.hpp>
#include <formflow/core/buffer.hpp>
#include <formflow/core/file.hpp>
#include <formflow/core/log.hpp>

#include <array>
#include <utility>

namespace formflow {

namespace {

/// 未提交的落盘文件：析构时删除（含协程帧被销毁的情况）
class partial_file_guard {
public:
    partial_file_guard() = default;
    ~partial_file_guard() { discard(); }

    partial_file_guard(const partial_file_guard&) = delete;
    auto operator=(const partial_file_guard&) -> partial_file_guard& = delete;

    void arm(std::filesystem::path p) { path_ = std::move(p); }
    void release() noexcept { path_.clear(); }

private:
    void discard() noexcept {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec)
            logger::error("disk_storage: failed to remove partial file {}: {}",
                          path_.string(), ec.message());
        path_.clear();
    }

    std::filesystem::path path_;
};

constexpr std::size_t max_len = FORMFLOW_MAX_FILENAME_LENGTH;

/// 生成名中保留的扩展名上限，超出则整体丢弃
constexpr std::size_t max_kept_extension = 32;

auto short_extension(std::string_view name) -> std::string {
    auto ext = file_extension(name);
    if (ext.size() > max_kept_extension) return {};
    return std::string(ext);
}

/// name + "-" + suffix，保持扩展名与长度上限
auto with_suffix(const std::string& name, std::string_view suffix) -> std::string {
    suffix = suffix.substr(0, max_kept_extension);
    auto ext = short_extension(name);
    auto stem = name.substr(0, name.size() - ext.size());

    // ext + "-" + suffix 不超过 2 * max_kept_extension + 1，budget 不会下溢
    auto budget = max_len - ext.size() - suffix.size() - 1;
    if (stem.size() > budget) {
        auto cut = budget;
        while (cut > 0 && (static_cast<unsigned char>(stem[cut]) & 0xC0) == 0x80) --cut;
        stem.resize(cut);
    }
    return stem + "-" + std::string(suffix) + ext;
}

auto unwritable(std::error_code cause) -> std::unexpected<upload_error> {
    auto err = make_upload_error(errc::destination_unwritable);
    err.cause = cause;
    return std::unexpected(std::move(err));
}

} // namespace

// =============================================================================
// filename_strategy
// =============================================================================

auto filename_strategy::resolve(const file_meta& meta) const -> std::string {
    auto original = sanitize_filename(meta.file_name.value_or(""));
    switch (kind_) {
        case kind::keep:
            return original;
        case kind::random:
            return sanitize_filename(random_identifier() + short_extension(original));
        case kind::custom:
            return sanitize_filename(fn_ ? fn_(meta) : original);
    }
    return original;
}

// =============================================================================
// create
// =============================================================================

auto disk_storage::create(disk_options options)
    -> std::expected<std::shared_ptr<disk_storage>, upload_error>
{
    if (options.destination.empty())
        return unwritable(std::make_error_code(std::errc::invalid_argument));

    std::error_code ec;
    std::filesystem::create_directories(options.destination, ec);
    if (ec) {
        logger::warn("disk_storage: cannot create {}: {}",
                     options.destination.string(), ec.message());
        return unwritable(ec);
    }
    if (!std::filesystem::is_directory(options.destination, ec))
        return unwritable(ec ? ec : std::make_error_code(std::errc::not_a_directory));

    // 写探测
    auto probe = options.destination / (".formflow-probe-" + random_identifier());
    {
        auto f = file::open(probe, open_mode::write | open_mode::create_new);
        if (!f) {
            logger::warn("disk_storage: {} is not writable: {}",
                         options.destination.string(), f.error().message());
            return unwritable(f.error());
        }
    }
    if (auto r = file::remove(probe); !r)
        return unwritable(r.error());

    return std::make_shared<disk_storage>(private_tag{}, std::move(options));
}

// =============================================================================
// commit
// =============================================================================

auto disk_storage::commit(const file_meta& meta, part_reader& reader)
    -> task<std::expected<stored_file, upload_error>>
{
    if (options_.filter && !options_.filter(meta)) {
        logger::debug("disk_storage: filter rejected field '{}'", meta.field_name);
        co_return std::unexpected(make_upload_error(errc::filter_rejected, meta.field_name));
    }

    auto name = options_.strategy.resolve(meta);

    // 守卫先于文件句柄声明：析构时先关闭句柄再删除
    partial_file_guard guard;
    file out;
    std::filesystem::path target;

    for (std::size_t attempt = 0; ; ++attempt) {
        auto candidate = attempt == 0
            ? name
            : with_suffix(name, random_identifier().substr(0, 8));
        target = options_.destination / candidate;

        auto opened = file::open(target, open_mode::write | open_mode::create_new);
        if (opened) {
            out = std::move(*opened);
            name = std::move(candidate);
            break;
        }
        if (opened.error() != std::errc::file_exists || attempt >= options_.collision_retries)
            co_return std::unexpected(wrap_error(opened.error(), meta.field_name));
    }
    guard.arm(target);

    std::uint64_t total = 0;
    for (;;) {
        auto pull = reader.next_chunk();
        auto r = co_await pull;
        if (!r)
            co_return std::unexpected(std::move(r.error()));
        if (!*r)
            break;

        auto chunk = **r;
        if (auto w = out.write_all(chunk); !w)
            co_return std::unexpected(wrap_error(w.error(), meta.field_name));
        total += chunk.size();
    }

    if (auto s = out.sync(); !s)
        co_return std::unexpected(wrap_error(s.error(), meta.field_name));
    out.close();
    guard.release();

    stored_file stored;
    stored.field_name = meta.field_name;
    stored.original_name = meta.file_name.value_or("");
    stored.sanitized_name = sanitize_filename(stored.original_name);
    stored.content_type = meta.content_type;
    stored.size = total;
    stored.storage_key = name;
    stored.path = target;

    logger::debug("disk_storage: wrote {} bytes to {}", total, target.string());
    co_return stored;
}

// =============================================================================
// cleanup / retrieve
// =============================================================================

auto disk_storage::cleanup(const stored_file& f)
    -> std::expected<void, std::error_code>
{
    if (!f.path) return {};
    return file::remove(*f.path);
}

auto disk_storage::retrieve(const stored_file& f) const
    -> std::expected<std::vector<std::byte>, std::error_code>
{
    if (!f.path)
        return std::unexpected(make_error_code(errc::io_error));

    auto in = file::open(*f.path, open_mode::read);
    if (!in) return std::unexpected(in.error());

    std::vector<std::byte> data;
    std::array<std::byte, 64 * 1024> buf{};
    for (;;) {
        auto n = in->read_some(buf);
        if (!n) return std::unexpected(n.error());
        if (*n == 0) break;
        data.insert(data.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(*n));
    }
    return data;
}

} // namespace formflow
