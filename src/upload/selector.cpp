#include <formflow/upload/selector.hpp>

namespace formflow {

selector_engine::selector_engine(const std::vector<field_rule>& rules,
                                 unknown_field_policy policy)
    : rules_(rules)
    , policy_(policy)
{
    for (auto& r : rules_) {
        if (r.kind() == selector_kind::any)
            any_rule_ = &r;
    }
}

auto selector_engine::find_exact(std::string_view field) const -> const field_rule* {
    for (auto& r : rules_) {
        if (r.is_exact() && r.matches(field)) return &r;
    }
    return nullptr;
}

auto selector_engine::unknown(std::string_view field) const
    -> std::expected<selection, upload_error>
{
    if (policy_ == unknown_field_policy::ignore)
        return selection{selector_action::ignore, nullptr};
    return std::unexpected(make_upload_error(errc::unexpected_field, std::string(field)));
}

auto selector_engine::select(std::string_view field, bool is_file)
    -> std::expected<selection, upload_error>
{
    if (auto* rule = find_exact(field)) {
        if (rule->kind() == selector_kind::none) {
            if (is_file) return unknown(field);
            return selection{selector_action::accept, nullptr};
        }

        auto& seen = counts_[std::string(field)];
        auto next = seen + 1;
        if (rule->max_count() && next > *rule->max_count()) {
            return std::unexpected(make_upload_error(
                is_file ? errc::too_many_files : errc::too_many_fields,
                std::string(field), *rule->max_count()));
        }
        seen = next;
        return selection{selector_action::accept, rule};
    }

    // 普通字段只受 max_fields 约束
    if (!is_file)
        return selection{selector_action::accept, nullptr};

    if (any_rule_ || rules_.empty())
        return selection{selector_action::accept, any_rule_};

    // 无名 none 或无 any：按未知字段策略处理
    return unknown(field);
}

auto selector_engine::finish() const -> std::expected<void, upload_error> {
    for (auto& r : rules_) {
        if (!r.is_exact() || r.min_count() == 0) continue;

        // fields 规则的上下限都按字段名分别计
        for (auto& n : r.names()) {
            if (count(n) < r.min_count()) {
                return std::unexpected(make_upload_error(
                    errc::missing_required_field, n, r.min_count()));
            }
        }
    }
    return {};
}

auto selector_engine::count(std::string_view field) const -> std::size_t {
    auto it = counts_.find(std::string(field));
    return it == counts_.end() ? 0 : it->second;
}

} // namespace formflow
