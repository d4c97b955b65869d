/// formflow unit tests — field_rule builders, upload_config validation

#include "test_framework.hpp"

#include <formflow/core/error.hpp>
#include <formflow/upload/config.hpp>

#include <string>

using namespace formflow;

static auto rejected_with(const upload_config& cfg, errc e) -> bool {
    auto r = validate(cfg);
    return !r && r.error().is(e) && r.error().kind() == error_kind::config;
}

// =============================================================================
// field_rule
// =============================================================================

TEST(rule_single_defaults) {
    auto r = field_rule::single("avatar");
    ASSERT_TRUE(r.kind() == selector_kind::single);
    ASSERT_EQ(r.min_count(), 0u);
    ASSERT_TRUE(r.max_count() == std::optional<std::size_t>{1});
    ASSERT_TRUE(r.is_exact());
    ASSERT_TRUE(r.matches("avatar"));
    ASSERT_FALSE(r.matches("Avatar"));
}

TEST(rule_modifiers_return_copies) {
    auto base = field_rule::array("photos", 3);
    auto req = base.required().with_mime_types({"image/*"}).with_max_size(1024);
    ASSERT_EQ(base.min_count(), 0u);
    ASSERT_TRUE(base.mime_types().empty());
    ASSERT_EQ(req.min_count(), 1u);
    ASSERT_EQ(req.mime_types().size(), 1u);
    ASSERT_TRUE(req.max_size() == std::optional<std::uint64_t>{1024});
}

TEST(rule_fields_matches_each_name) {
    auto r = field_rule::fields({"front", "back"}, 2);
    ASSERT_TRUE(r.matches("front"));
    ASSERT_TRUE(r.matches("back"));
    ASSERT_FALSE(r.matches("side"));
}

TEST(rule_none_and_any_shapes) {
    ASSERT_FALSE(field_rule::none().is_exact());
    ASSERT_TRUE(field_rule::none("secret").is_exact());
    ASSERT_FALSE(field_rule::any().is_exact());
    ASSERT_FALSE(field_rule::any().max_count().has_value());
    ASSERT_EQ(to_string(selector_kind::fields), std::string_view("fields"));
}

// =============================================================================
// validate
// =============================================================================

TEST(validate_accepts_reasonable_config) {
    upload_config cfg;
    cfg.rules = {
        field_rule::single("avatar").required().with_mime_types({"image/*"}),
        field_rule::array("docs", 5).with_max_size(1 << 20),
        field_rule::none("password"),
    };
    cfg.limits.max_file_size = 10;
    cfg.limits.max_files = 6;
    ASSERT_TRUE(validate(cfg).has_value());
}

TEST(validate_empty_config_ok) {
    upload_config cfg;
    ASSERT_TRUE(validate(cfg).has_value());
}

TEST(validate_zero_limits) {
    {
        upload_config cfg;
        cfg.limits.max_file_size = 0;
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_limit));
        ASSERT_EQ(validate(cfg).error().field, std::string("max_file_size"));
    }
    {
        upload_config cfg;
        cfg.limits.max_files = 0;
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_limit));
    }
    {
        upload_config cfg;
        cfg.limits.max_body_size = 0;
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_limit));
    }
    {
        upload_config cfg;
        cfg.limits.max_header_size = 0;
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_limit));
    }
    {
        upload_config cfg;
        cfg.limits.allowed_mime_types = {"image/png", ""};
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_limit));
    }
}

TEST(validate_invalid_rules) {
    {
        upload_config cfg;
        cfg.rules = {field_rule::single("")};
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_rule));
    }
    {
        upload_config cfg;
        cfg.rules = {field_rule::array("photos", 0)};
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_rule));
    }
    {
        upload_config cfg;
        cfg.rules = {field_rule::array("photos", 2).with_min(3)};
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_rule));
    }
    {
        upload_config cfg;
        cfg.rules = {field_rule::fields({})};
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_rule));
    }
    {
        upload_config cfg;
        cfg.rules = {field_rule::any().required()};
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_rule));
    }
    {
        upload_config cfg;
        cfg.rules = {field_rule::single("a").with_mime_types({""})};
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_rule));
    }
    {
        upload_config cfg;
        cfg.rules = {field_rule::single("a").with_max_size(0)};
        ASSERT_TRUE(rejected_with(cfg, errc::invalid_limit));
    }
}

TEST(validate_conflicting_rules) {
    {
        upload_config cfg;
        cfg.rules = {field_rule::single("avatar"), field_rule::array("avatar")};
        ASSERT_TRUE(rejected_with(cfg, errc::conflicting_rules));
        ASSERT_EQ(validate(cfg).error().field, std::string("avatar"));
    }
    {
        upload_config cfg;
        cfg.rules = {field_rule::fields({"a", "b"}), field_rule::none("b")};
        ASSERT_TRUE(rejected_with(cfg, errc::conflicting_rules));
    }
    {
        upload_config cfg;
        cfg.rules = {field_rule::any(), field_rule::any()};
        ASSERT_TRUE(rejected_with(cfg, errc::conflicting_rules));
    }
    {
        upload_config cfg;
        cfg.rules = {field_rule::none(), field_rule::none()};
        ASSERT_TRUE(rejected_with(cfg, errc::conflicting_rules));
    }
    {
        upload_config cfg;
        cfg.rules = {field_rule::any(), field_rule::none()};
        ASSERT_TRUE(rejected_with(cfg, errc::conflicting_rules));
    }
}

RUN_TESTS()
