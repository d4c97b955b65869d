#include <formflow/multipart/part_headers.hpp>
#include <formflow/multipart/header_values.hpp>
#include <formflow/core/error.hpp>

namespace formflow::multipart {

auto part_header_list::find(std::string_view name) const
    -> std::optional<std::string_view>
{
    for (auto& [k, v] : entries) {
        if (detail::iequals(k, name)) return std::string_view{v};
    }
    return std::nullopt;
}

auto split_header_lines(std::string_view block)
    -> std::expected<part_header_list, std::error_code>
{
    part_header_list headers;

    while (!block.empty()) {
        // 找行结束
        auto eol = block.find("\r\n");
        std::string_view line;
        if (eol == std::string_view::npos) {
            line = block;
            block = {};
        } else {
            line = block.substr(0, eol);
            block.remove_prefix(eol + 2);
        }

        if (line.empty()) continue;

        // continuation line：拼接到上一个 header
        if (line[0] == ' ' || line[0] == '\t') {
            if (headers.entries.empty())
                return std::unexpected(make_error_code(errc::invalid_header));
            auto& value = headers.entries.back().second;
            value += ' ';
            value += detail::trim_ows(detail::skip_ows(line));
            continue;
        }

        // 解析 "Key: Value"
        auto colon = line.find(':');
        if (colon == std::string_view::npos)
            return std::unexpected(make_error_code(errc::invalid_header));

        auto key = detail::trim_ows(line.substr(0, colon));
        if (key.empty())
            return std::unexpected(make_error_code(errc::invalid_header));

        auto value = detail::trim_ows(detail::skip_ows(line.substr(colon + 1)));
        headers.entries.emplace_back(std::string(key), std::string(value));
    }

    return headers;
}

auto parse_part_headers(std::string_view block)
    -> std::expected<part_info, std::error_code>
{
    auto lines = split_header_lines(block);
    if (!lines) return std::unexpected(lines.error());

    part_info info;
    info.headers = std::move(*lines);

    auto disposition = info.headers.find("Content-Disposition");
    if (!disposition)
        return std::unexpected(make_error_code(errc::missing_field_name));

    auto cd = parse_content_disposition(*disposition);
    if (!cd.name || cd.name->empty())
        return std::unexpected(make_error_code(errc::missing_field_name));

    info.field_name = std::move(*cd.name);
    info.file_name = cd.effective_filename();

    if (auto ct = info.headers.find("Content-Type")) {
        info.content_type = parse_content_type(*ct).mime;
    }
    if (info.content_type.empty()) {
        info.content_type = info.is_file() ? "application/octet-stream" : "text/plain";
    }

    return info;
}

} // namespace formflow::multipart
