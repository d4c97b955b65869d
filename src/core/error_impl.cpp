#include <formflow/config.hpp>
#include <formflow/core/error.hpp>

#ifdef FORMFLOW_PLATFORM_WINDOWS
#include <Windows.h>
#else
#include <cerrno>
#endif

#include <fmt/format.h>

namespace formflow {

auto upload_error_category::message(int ev) const -> std::string {
    switch (static_cast<errc>(ev)) {
        case errc::success:                 return "success";
        case errc::invalid_limit:           return "limit must be positive";
        case errc::invalid_rule:            return "invalid field rule";
        case errc::conflicting_rules:       return "conflicting field rules";
        case errc::destination_unwritable:  return "storage destination is not writable";
        case errc::invalid_content_type:    return "Content-Type must be multipart/form-data";
        case errc::missing_boundary:        return "missing multipart boundary parameter";
        case errc::invalid_boundary:        return "invalid multipart boundary";
        case errc::malformed_boundary:      return "malformed multipart boundary";
        case errc::unexpected_eof:          return "stream ended before the terminal boundary";
        case errc::header_too_large:        return "part header block too large";
        case errc::invalid_header:          return "invalid part header line";
        case errc::missing_field_name:      return "missing field name in Content-Disposition";
        case errc::body_stream_failed:      return "body stream failed";
        case errc::file_too_large:          return "file too large";
        case errc::field_too_large:         return "field too large";
        case errc::body_too_large:          return "request body too large";
        case errc::too_many_files:          return "too many files";
        case errc::too_many_fields:         return "too many fields";
        case errc::disallowed_mime_type:    return "MIME type not allowed";
        case errc::unexpected_field:        return "unexpected field";
        case errc::missing_required_field:  return "required field missing";
        case errc::io_error:                return "storage I/O error";
        case errc::permission_denied:       return "permission denied";
        case errc::no_space:                return "no space left on storage";
        case errc::file_exists:             return "file already exists";
        case errc::filter_rejected:         return "file filter rejected the upload";
        case errc::cancelled:               return "operation cancelled";
        default:                            return "unrecognized error";
    }
}

auto kind_of(errc e) noexcept -> error_kind {
    switch (e) {
        case errc::success:
            return error_kind::none;

        case errc::invalid_limit:
        case errc::invalid_rule:
        case errc::conflicting_rules:
        case errc::destination_unwritable:
            return error_kind::config;

        case errc::invalid_content_type:
        case errc::missing_boundary:
        case errc::invalid_boundary:
        case errc::malformed_boundary:
        case errc::unexpected_eof:
        case errc::header_too_large:
        case errc::invalid_header:
        case errc::missing_field_name:
        case errc::body_stream_failed:
            return error_kind::parse;

        case errc::file_too_large:
        case errc::field_too_large:
        case errc::body_too_large:
        case errc::too_many_files:
        case errc::too_many_fields:
        case errc::disallowed_mime_type:
        case errc::unexpected_field:
        case errc::missing_required_field:
            return error_kind::limit;

        case errc::io_error:
        case errc::permission_denied:
        case errc::no_space:
        case errc::file_exists:
        case errc::filter_rejected:
            return error_kind::storage;

        case errc::cancelled:
            return error_kind::cancelled;
    }
    return error_kind::storage;
}

auto kind_of(const std::error_code& ec) noexcept -> error_kind {
    if (!ec) return error_kind::none;
    if (ec.category() != upload_category()) return error_kind::storage;
    return kind_of(static_cast<errc>(ec.value()));
}

auto to_string(error_kind k) noexcept -> std::string_view {
    switch (k) {
        case error_kind::none:      return "none";
        case error_kind::config:    return "config";
        case error_kind::parse:     return "parse";
        case error_kind::limit:     return "limit";
        case error_kind::storage:   return "storage";
        case error_kind::cancelled: return "cancelled";
    }
    return "unknown";
}

auto from_native_error([[maybe_unused]] int native_error) noexcept -> errc {
#ifdef FORMFLOW_PLATFORM_WINDOWS
    switch (native_error) {
        case 0:                      return errc::success;
        case ERROR_ACCESS_DENIED:    return errc::permission_denied;
        case ERROR_FILE_EXISTS:
        case ERROR_ALREADY_EXISTS:   return errc::file_exists;
        case ERROR_DISK_FULL:
        case ERROR_HANDLE_DISK_FULL: return errc::no_space;
        case ERROR_OPERATION_ABORTED:return errc::cancelled;
        default:                     return errc::io_error;
    }
#else
    switch (native_error) {
        case 0:         return errc::success;
        case EACCES:
        case EPERM:
        case EROFS:     return errc::permission_denied;
        case EEXIST:    return errc::file_exists;
        case ENOSPC:
        case EDQUOT:    return errc::no_space;
        case ECANCELED: return errc::cancelled;
        default:        return errc::io_error;
    }
#endif
}

auto upload_error::message() const -> std::string {
    auto text = code.message();
    if (!field.empty())
        text += fmt::format(" (field \"{}\")", field);
    if (limit != 0)
        text += fmt::format(" [limit {}]", limit);
    if (cause)
        text += fmt::format(": {}", cause.message());
    return text;
}

auto wrap_error(std::error_code ec, std::string field) -> upload_error {
    if (ec.category() == upload_category()) {
        upload_error err;
        err.code = ec;
        err.field = std::move(field);
        return err;
    }

    // 原生错误码（system/generic 类别）先映射为 formflow::errc
    auto mapped = errc::io_error;
    if (ec.category() == std::generic_category() ||
        ec.category() == std::system_category()) {
        mapped = from_native_error(ec.value());
        if (mapped == errc::success) mapped = errc::io_error;
    }

    upload_error err;
    err.code = make_error_code(mapped);
    err.field = std::move(field);
    err.cause = ec;
    return err;
}

} // namespace formflow
