#include <formflow/storage/memory_storage.hpp>
#include <formflow/storage/sanitize.hpp>
#include <formflow/core/log.hpp>

namespace formflow {

auto memory_storage::commit(const file_meta& meta, part_reader& reader)
    -> task<std::expected<stored_file, upload_error>>
{
    auto data = std::make_shared<std::vector<std::byte>>();

    for (;;) {
        auto pull = reader.next_chunk();
        auto r = co_await pull;
        if (!r)
            co_return std::unexpected(std::move(r.error()));
        if (!*r)
            break;

        auto chunk = **r;
        if (max_buffer_size_ && data->size() + chunk.size() > *max_buffer_size_) {
            co_return std::unexpected(make_upload_error(
                errc::file_too_large, meta.field_name, *max_buffer_size_));
        }
        data->insert(data->end(), chunk.begin(), chunk.end());
    }

    stored_file out;
    out.field_name = meta.field_name;
    out.original_name = meta.file_name.value_or("");
    out.sanitized_name = sanitize_filename(out.original_name);
    out.content_type = meta.content_type;
    out.size = data->size();
    out.storage_key = random_identifier();
    out.buffer = std::move(data);

    logger::debug("memory_storage: stored {} bytes for field '{}'", out.size, out.field_name);
    co_return out;
}

auto memory_storage::cleanup(const stored_file&)
    -> std::expected<void, std::error_code>
{
    return {};
}

auto memory_storage::retrieve(const stored_file& file) const
    -> std::expected<std::vector<std::byte>, std::error_code>
{
    if (!file.buffer)
        return std::unexpected(make_error_code(errc::io_error));
    return *file.buffer;
}

} // namespace formflow
