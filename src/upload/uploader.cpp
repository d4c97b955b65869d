#include <formflow/upload/uploader.hpp>
#include <formflow/upload/session.hpp>
#include <formflow/multipart/boundary.hpp>
#include <formflow/core/log.hpp>

namespace formflow {

namespace {

auto run_session(std::shared_ptr<const upload_config> config,
                 std::shared_ptr<storage_engine> storage,
                 std::string content_type,
                 chunk_source& source,
                 cancel_token* token)
    -> task<std::expected<parse_result, upload_error>>
{
    auto boundary = multipart::extract_boundary(content_type);
    if (!boundary) {
        logger::debug("rejecting request: {} (Content-Type '{}')",
                      boundary.error().message(), content_type);
        co_return std::unexpected(wrap_error(boundary.error()));
    }

    parse_session session{std::move(config), std::move(storage),
                          std::move(*boundary), source, token};
    auto run = session.run();
    auto r = co_await run;
    co_return std::move(r);
}

} // namespace

auto uploader::create(upload_config config, std::shared_ptr<storage_engine> storage)
    -> std::expected<uploader, upload_error>
{
    if (!storage) {
        logger::warn("uploader: no storage engine configured");
        return std::unexpected(make_upload_error(errc::destination_unwritable));
    }

    if (auto v = validate(config); !v) {
        logger::warn("uploader: configuration rejected: {}", v.error().message());
        return std::unexpected(std::move(v.error()));
    }

    return uploader{std::make_shared<const upload_config>(std::move(config)),
                    std::move(storage)};
}

auto uploader::parse(std::string content_type,
                     chunk_source& source,
                     cancel_token* token) const
    -> task<std::expected<parse_result, upload_error>>
{
    return run_session(config_, storage_, std::move(content_type), source, token);
}

} // namespace formflow
