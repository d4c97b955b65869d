#include <formflow/upload/config.hpp>

#include <unordered_set>
#include <utility>

namespace formflow {

auto to_string(selector_kind k) noexcept -> std::string_view {
    switch (k) {
        case selector_kind::single: return "single";
        case selector_kind::array:  return "array";
        case selector_kind::fields: return "fields";
        case selector_kind::none:   return "none";
        case selector_kind::any:    return "any";
    }
    return "unknown";
}

// =============================================================================
// field_rule
// =============================================================================

field_rule::field_rule(selector_kind kind, std::vector<std::string> names,
                       std::optional<std::size_t> max_count)
    : kind_(kind)
    , names_(std::move(names))
    , max_count_(max_count)
{}

auto field_rule::single(std::string name) -> field_rule {
    std::vector<std::string> names;
    names.push_back(std::move(name));
    return field_rule{selector_kind::single, std::move(names), 1};
}

auto field_rule::array(std::string name, std::optional<std::size_t> max_count)
    -> field_rule
{
    std::vector<std::string> names;
    names.push_back(std::move(name));
    return field_rule{selector_kind::array, std::move(names), max_count};
}

auto field_rule::fields(std::vector<std::string> names,
                        std::optional<std::size_t> max_count) -> field_rule
{
    return field_rule{selector_kind::fields, std::move(names), max_count};
}

auto field_rule::none() -> field_rule {
    return field_rule{selector_kind::none, {}, 0};
}

auto field_rule::none(std::string name) -> field_rule {
    std::vector<std::string> names;
    names.push_back(std::move(name));
    return field_rule{selector_kind::none, std::move(names), 0};
}

auto field_rule::any() -> field_rule {
    return field_rule{selector_kind::any, {}, std::nullopt};
}

auto field_rule::with_min(std::size_t n) const -> field_rule {
    auto copy = *this;
    copy.min_count_ = n;
    return copy;
}

auto field_rule::with_mime_types(std::vector<std::string> types) const -> field_rule {
    auto copy = *this;
    copy.mime_types_ = std::move(types);
    return copy;
}

auto field_rule::with_max_size(std::uint64_t bytes) const -> field_rule {
    auto copy = *this;
    copy.max_size_ = bytes;
    return copy;
}

auto field_rule::matches(std::string_view field) const noexcept -> bool {
    for (auto& n : names_) {
        if (n == field) return true;
    }
    return false;
}

// =============================================================================
// validate
// =============================================================================

namespace {

auto config_error(errc e, std::string what) -> std::unexpected<upload_error> {
    return std::unexpected(make_upload_error(e, std::move(what)));
}

auto check_limits(const limits& l) -> std::expected<void, upload_error> {
    if (l.max_file_size && *l.max_file_size == 0)
        return config_error(errc::invalid_limit, "max_file_size");
    if (l.max_field_size && *l.max_field_size == 0)
        return config_error(errc::invalid_limit, "max_field_size");
    if (l.max_files && *l.max_files == 0)
        return config_error(errc::invalid_limit, "max_files");
    if (l.max_fields && *l.max_fields == 0)
        return config_error(errc::invalid_limit, "max_fields");
    if (l.max_body_size && *l.max_body_size == 0)
        return config_error(errc::invalid_limit, "max_body_size");
    if (l.max_header_size == 0)
        return config_error(errc::invalid_limit, "max_header_size");
    for (auto& t : l.allowed_mime_types) {
        if (t.empty())
            return config_error(errc::invalid_limit, "allowed_mime_types");
    }
    return {};
}

auto rule_label(const field_rule& r) -> std::string {
    if (r.names().empty()) return std::string(to_string(r.kind()));
    return r.names().front();
}

auto check_rule(const field_rule& r) -> std::expected<void, upload_error> {
    auto label = rule_label(r);

    switch (r.kind()) {
        case selector_kind::single:
        case selector_kind::array:
        case selector_kind::fields:
            if (r.names().empty())
                return config_error(errc::invalid_rule, label);
            if (r.max_count() && *r.max_count() == 0)
                return config_error(errc::invalid_rule, label);
            if (r.max_count() && r.min_count() > *r.max_count())
                return config_error(errc::invalid_rule, label);
            break;
        case selector_kind::none:
        case selector_kind::any:
            // 无数量语义
            if (r.min_count() > 0)
                return config_error(errc::invalid_rule, label);
            break;
    }

    for (auto& n : r.names()) {
        if (n.empty())
            return config_error(errc::invalid_rule, label);
    }
    for (auto& t : r.mime_types()) {
        if (t.empty())
            return config_error(errc::invalid_rule, label);
    }
    if (r.max_size() && *r.max_size() == 0)
        return config_error(errc::invalid_limit, label);

    return {};
}

} // namespace

auto validate(const upload_config& cfg) -> std::expected<void, upload_error> {
    if (auto r = check_limits(cfg.limits); !r)
        return r;

    std::unordered_set<std::string> claimed;
    std::size_t any_rules = 0;
    std::size_t catch_all_none = 0;

    for (auto& rule : cfg.rules) {
        if (auto r = check_rule(rule); !r)
            return r;

        if (rule.kind() == selector_kind::any) ++any_rules;
        if (rule.kind() == selector_kind::none && !rule.is_exact()) ++catch_all_none;

        // 同一字段名只能归属一条规则
        for (auto& n : rule.names()) {
            if (!claimed.insert(n).second)
                return config_error(errc::conflicting_rules, n);
        }
    }

    if (any_rules > 1)
        return config_error(errc::conflicting_rules, "any");
    if (catch_all_none > 1)
        return config_error(errc::conflicting_rules, "none");
    if (any_rules > 0 && catch_all_none > 0)
        return config_error(errc::conflicting_rules, "any");

    return {};
}

} // namespace formflow
