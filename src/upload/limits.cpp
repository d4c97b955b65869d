#include <formflow/upload/limits.hpp>
#include <formflow/multipart/header_values.hpp>

namespace formflow {

auto mime_matches(std::string_view pattern, std::string_view type) noexcept -> bool {
    if (pattern == "*" || pattern == "*/*") return true;

    // "type/*"
    if (pattern.size() >= 2 && pattern.substr(pattern.size() - 2) == "/*") {
        auto prefix = pattern.substr(0, pattern.size() - 1);   // 含 '/'
        return type.size() > prefix.size() &&
               multipart::detail::iequals(type.substr(0, prefix.size()), prefix);
    }

    return multipart::detail::iequals(pattern, type);
}

auto mime_allowed(std::span<const std::string> patterns, std::string_view type) noexcept
    -> bool
{
    if (patterns.empty()) return true;
    for (auto& p : patterns) {
        if (mime_matches(p, type)) return true;
    }
    return false;
}

auto limit_enforcer::on_body_chunk(std::size_t n) -> std::expected<void, upload_error> {
    auto next = body_bytes_ + n;
    if (limits_.max_body_size && next > *limits_.max_body_size) {
        return std::unexpected(make_upload_error(
            errc::body_too_large, {}, *limits_.max_body_size));
    }
    body_bytes_ = next;
    return {};
}

auto limit_enforcer::begin_part(std::string_view field, bool is_file,
                                std::string_view content_type,
                                const field_rule* rule)
    -> std::expected<void, upload_error>
{
    if (is_file) {
        auto next = files_ + 1;
        if (limits_.max_files && next > *limits_.max_files) {
            return std::unexpected(make_upload_error(
                errc::too_many_files, std::string(field), *limits_.max_files));
        }

        // 规则自带白名单时覆盖全局白名单
        std::span<const std::string> allow = limits_.allowed_mime_types;
        if (rule && !rule->mime_types().empty())
            allow = rule->mime_types();
        if (!mime_allowed(allow, content_type)) {
            return std::unexpected(make_upload_error(
                errc::disallowed_mime_type, std::string(field)));
        }
        files_ = next;
    } else {
        auto next = fields_ + 1;
        if (limits_.max_fields && next > *limits_.max_fields) {
            return std::unexpected(make_upload_error(
                errc::too_many_fields, std::string(field), *limits_.max_fields));
        }
        fields_ = next;
    }

    part_field_ = std::string(field);
    part_is_file_ = is_file;
    part_bytes_ = 0;
    if (rule && rule->max_size())
        part_limit_ = rule->max_size();
    else
        part_limit_ = is_file ? limits_.max_file_size : limits_.max_field_size;

    return {};
}

auto limit_enforcer::on_part_data(std::size_t n) -> std::expected<void, upload_error> {
    auto next = part_bytes_ + n;
    if (part_limit_ && next > *part_limit_) {
        return std::unexpected(make_upload_error(
            part_is_file_ ? errc::file_too_large : errc::field_too_large,
            part_field_, *part_limit_));
    }
    part_bytes_ = next;
    return {};
}

void limit_enforcer::end_part() noexcept {
    part_field_.clear();
    part_is_file_ = false;
    part_bytes_ = 0;
    part_limit_.reset();
}

} // namespace formflow
