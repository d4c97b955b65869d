#include <formflow/multipart/header_values.hpp>

namespace formflow::multipart {

namespace detail {

namespace {

inline auto hex_digit(char c) noexcept -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

inline auto lower(char c) noexcept -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

/// RFC 5987 ext-value: charset'language'value-chars
/// e.g. "UTF-8''my%20file.txt" → "my file.txt"
auto decode_ext_value(std::string_view input) -> std::string {
    auto tick1 = input.find('\'');
    if (tick1 == std::string_view::npos) return std::string(input);
    auto tick2 = input.find('\'', tick1 + 1);
    if (tick2 == std::string_view::npos) return std::string(input);

    // charset 暂不做转换，按 UTF-8 原样输出字节
    return url_decode(input.substr(tick2 + 1), /*plus_as_space=*/false);
}

} // namespace

auto skip_ows(std::string_view s) noexcept -> std::string_view {
    while (!s.empty() && (s[0] == ' ' || s[0] == '\t'))
        s.remove_prefix(1);
    return s;
}

auto trim_ows(std::string_view s) noexcept -> std::string_view {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

auto parse_quoted_string(std::string_view s)
    -> std::pair<std::string, std::string_view>
{
    // s 以 '"' 开始
    if (s.empty() || s[0] != '"') return {{}, s};
    s.remove_prefix(1);

    std::string val;
    while (!s.empty()) {
        if (s[0] == '"') {
            s.remove_prefix(1);
            return {val, s};
        }
        if (s[0] == '\\' && s.size() > 1) {
            val += s[1];
            s.remove_prefix(2);
        } else {
            val += s[0];
            s.remove_prefix(1);
        }
    }
    return {val, s}; // 缺少闭合引号，尽力而为
}

auto parse_token(std::string_view s)
    -> std::pair<std::string, std::string_view>
{
    std::size_t i = 0;
    while (i < s.size()) {
        char c = s[i];
        // tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." /
        //         "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
        if ((c >= '!' && c <= '~') && c != '"' && c != '(' && c != ')' &&
            c != ',' && c != '/' && c != ':' && c != ';' && c != '<' &&
            c != '=' && c != '>' && c != '?' && c != '@' && c != '[' &&
            c != ']' && c != '{' && c != '}' && c != '\\') {
            ++i;
        } else {
            break;
        }
    }
    return {std::string(s.substr(0, i)), s.substr(i)};
}

auto to_lower(std::string s) -> std::string {
    for (auto& c : s) c = lower(c);
    return s;
}

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (lower(a[i]) != lower(b[i])) return false;
    }
    return true;
}

} // namespace detail

auto url_decode(std::string_view input, bool plus_as_space) -> std::string {
    std::string out;
    out.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            auto hi = detail::hex_digit(input[i + 1]);
            auto lo = detail::hex_digit(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (plus_as_space && input[i] == '+') {
            out += ' ';
        } else {
            out += input[i];
        }
    }
    return out;
}

// =============================================================================
// Content-Type
// =============================================================================

auto content_type::param(std::string_view key) const
    -> std::optional<std::string_view>
{
    for (auto& [k, v] : params) {
        if (detail::iequals(k, key)) return std::string_view{v};
    }
    return std::nullopt;
}

auto parse_content_type(std::string_view header) -> content_type {
    content_type ct;
    header = detail::skip_ows(header);

    // mime type: token "/" token
    auto [type_part, rest] = detail::parse_token(header);
    if (!rest.empty() && rest[0] == '/') {
        rest.remove_prefix(1);
        auto [sub, rest2] = detail::parse_token(rest);
        ct.mime = detail::to_lower(type_part) + "/" + detail::to_lower(sub);
        rest = rest2;
    } else {
        ct.mime = detail::to_lower(type_part);
    }

    // 参数: (; name=value)*
    while (!rest.empty()) {
        rest = detail::skip_ows(rest);
        if (rest.empty() || rest[0] != ';') break;
        rest.remove_prefix(1);
        rest = detail::skip_ows(rest);

        auto [pname, rest2] = detail::parse_token(rest);
        rest = rest2;
        if (pname.empty()) break;

        auto key = detail::to_lower(pname);
        if (rest.empty() || rest[0] != '=') {
            ct.params.try_emplace(std::move(key));
            continue;
        }
        rest.remove_prefix(1); // skip '='

        std::string pval;
        if (!rest.empty() && rest[0] == '"') {
            auto [qval, rest3] = detail::parse_quoted_string(rest);
            pval = std::move(qval);
            rest = rest3;
        } else {
            auto end = rest.find(';');
            auto raw = (end != std::string_view::npos) ? rest.substr(0, end) : rest;
            pval = std::string(detail::trim_ows(raw));
            rest = (end != std::string_view::npos) ? rest.substr(end) : std::string_view{};
        }
        // 重复参数以首次出现为准
        ct.params.try_emplace(std::move(key), std::move(pval));
    }

    return ct;
}

// =============================================================================
// Content-Disposition
// =============================================================================

auto parse_content_disposition(std::string_view header) -> content_disposition {
    content_disposition cd;
    header = detail::skip_ows(header);

    // disposition type
    auto [dtype, rest] = detail::parse_token(header);
    cd.type = detail::to_lower(dtype);

    // 参数
    while (!rest.empty()) {
        rest = detail::skip_ows(rest);
        if (rest.empty() || rest[0] != ';') break;
        rest.remove_prefix(1);
        rest = detail::skip_ows(rest);

        auto [pname, rest2] = detail::parse_token(rest);
        rest = detail::skip_ows(rest2);
        if (pname.empty()) break;

        auto pname_lower = detail::to_lower(pname);

        if (rest.empty() || rest[0] != '=') continue;
        rest.remove_prefix(1);
        rest = detail::skip_ows(rest);

        // filename* 使用 ext-value 语法 (不加引号)
        if (pname_lower == "filename*") {
            auto end = rest.find(';');
            auto raw = (end != std::string_view::npos) ? rest.substr(0, end) : rest;
            cd.filename_star = detail::decode_ext_value(detail::trim_ows(raw));
            rest = (end != std::string_view::npos) ? rest.substr(end) : std::string_view{};
            continue;
        }

        std::string pval;
        if (!rest.empty() && rest[0] == '"') {
            auto [qval, rest3] = detail::parse_quoted_string(rest);
            pval = std::move(qval);
            rest = rest3;
        } else {
            auto [tval, rest3] = detail::parse_token(rest);
            pval = std::move(tval);
            rest = rest3;
        }

        if (pname_lower == "name") {
            if (!cd.name) cd.name = std::move(pval);
        } else if (pname_lower == "filename") {
            if (!cd.filename) cd.filename = std::move(pval);
        }
    }

    return cd;
}

} // namespace formflow::multipart
