#include <formflow/config.hpp>
#include <formflow/multipart/boundary.hpp>
#include <formflow/multipart/header_values.hpp>
#include <formflow/core/error.hpp>

namespace formflow::multipart {

auto is_boundary_char(char c) noexcept -> bool {
    if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))
        return true;
    switch (c) {
        case '\'': case '(': case ')': case '+': case '_': case ',':
        case '-':  case '.': case '/': case ':': case '=': case '?':
        case ' ':
            return true;
        default:
            return false;
    }
}

auto validate_boundary(std::string_view boundary)
    -> std::expected<void, std::error_code>
{
    if (boundary.empty() || boundary.size() > FORMFLOW_MAX_BOUNDARY_LENGTH)
        return std::unexpected(make_error_code(errc::invalid_boundary));
    if (boundary.back() == ' ')
        return std::unexpected(make_error_code(errc::invalid_boundary));
    for (auto c : boundary) {
        if (!is_boundary_char(c))
            return std::unexpected(make_error_code(errc::invalid_boundary));
    }
    return {};
}

auto extract_boundary(std::string_view content_type_value)
    -> std::expected<std::string, std::error_code>
{
    auto ct = parse_content_type(content_type_value);
    if (ct.mime != "multipart/form-data")
        return std::unexpected(make_error_code(errc::invalid_content_type));

    auto boundary = ct.param("boundary");
    if (!boundary)
        return std::unexpected(make_error_code(errc::missing_boundary));

    auto valid = validate_boundary(*boundary);
    if (!valid)
        return std::unexpected(valid.error());

    return std::string{*boundary};
}

} // namespace formflow::multipart
