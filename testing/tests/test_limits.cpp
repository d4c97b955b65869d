/// formflow unit tests — MIME matching, limit_enforcer boundaries

#include "test_framework.hpp"

#include <formflow/core/error.hpp>
#include <formflow/upload/config.hpp>
#include <formflow/upload/limits.hpp>

#include <string>
#include <vector>

using namespace formflow;

// =============================================================================
// MIME
// =============================================================================

TEST(mime_exact_and_case) {
    ASSERT_TRUE(mime_matches("image/png", "image/png"));
    ASSERT_TRUE(mime_matches("Image/PNG", "image/png"));
    ASSERT_FALSE(mime_matches("image/png", "image/jpeg"));
}

TEST(mime_wildcards) {
    ASSERT_TRUE(mime_matches("*", "application/pdf"));
    ASSERT_TRUE(mime_matches("*/*", "text/plain"));
    ASSERT_TRUE(mime_matches("image/*", "image/webp"));
    ASSERT_FALSE(mime_matches("image/*", "imagex/png"));
    ASSERT_FALSE(mime_matches("image/*", "image/"));
    ASSERT_FALSE(mime_matches("image/*", "text/plain"));
}

TEST(mime_allowed_list) {
    std::vector<std::string> none;
    ASSERT_TRUE(mime_allowed(none, "anything/at-all"));

    std::vector<std::string> list{"image/*", "application/pdf"};
    ASSERT_TRUE(mime_allowed(list, "image/gif"));
    ASSERT_TRUE(mime_allowed(list, "application/pdf"));
    ASSERT_FALSE(mime_allowed(list, "application/zip"));
}

// =============================================================================
// limit_enforcer
// =============================================================================

TEST(file_size_limit_inclusive) {
    limits l;
    l.max_file_size = 10;
    limit_enforcer e{l};

    ASSERT_TRUE(e.begin_part("f", true, "text/plain", nullptr).has_value());
    ASSERT_TRUE(e.on_part_data(4).has_value());
    ASSERT_TRUE(e.on_part_data(6).has_value());   // 恰好等于上限
    auto over = e.on_part_data(1);
    ASSERT_FALSE(over.has_value());
    ASSERT_TRUE(over.error().is(errc::file_too_large));
    ASSERT_EQ(over.error().limit, 10u);
    ASSERT_EQ(over.error().field, std::string("f"));
    ASSERT_EQ(e.part_bytes(), 10u);
}

TEST(field_size_limit) {
    limits l;
    l.max_field_size = 3;
    limit_enforcer e{l};
    ASSERT_TRUE(e.begin_part("t", false, "text/plain", nullptr).has_value());
    auto over = e.on_part_data(4);
    ASSERT_FALSE(over.has_value());
    ASSERT_TRUE(over.error().is(errc::field_too_large));
}

TEST(field_limit_does_not_apply_to_files) {
    limits l;
    l.max_field_size = 3;
    limit_enforcer e{l};
    ASSERT_TRUE(e.begin_part("f", true, "text/plain", nullptr).has_value());
    ASSERT_TRUE(e.on_part_data(1000).has_value());
}

TEST(part_limit_resets_between_parts) {
    limits l;
    l.max_file_size = 5;
    limit_enforcer e{l};
    ASSERT_TRUE(e.begin_part("a", true, "x/y", nullptr).has_value());
    ASSERT_TRUE(e.on_part_data(5).has_value());
    e.end_part();
    ASSERT_TRUE(e.begin_part("b", true, "x/y", nullptr).has_value());
    ASSERT_TRUE(e.on_part_data(5).has_value());
}

TEST(body_size_limit_inclusive) {
    limits l;
    l.max_body_size = 100;
    limit_enforcer e{l};
    ASSERT_TRUE(e.on_body_chunk(60).has_value());
    ASSERT_TRUE(e.on_body_chunk(40).has_value());
    auto over = e.on_body_chunk(1);
    ASSERT_FALSE(over.has_value());
    ASSERT_TRUE(over.error().is(errc::body_too_large));
    ASSERT_EQ(e.body_bytes(), 100u);
}

TEST(file_count_limit) {
    limits l;
    l.max_files = 2;
    limit_enforcer e{l};
    ASSERT_TRUE(e.begin_part("a", true, "x/y", nullptr).has_value());
    e.end_part();
    ASSERT_TRUE(e.begin_part("b", true, "x/y", nullptr).has_value());
    e.end_part();
    auto third = e.begin_part("c", true, "x/y", nullptr);
    ASSERT_FALSE(third.has_value());
    ASSERT_TRUE(third.error().is(errc::too_many_files));
    ASSERT_EQ(third.error().limit, 2u);
    ASSERT_EQ(e.file_count(), 2u);

    // 普通字段不占文件名额
    ASSERT_TRUE(e.begin_part("t", false, "text/plain", nullptr).has_value());
}

TEST(field_count_limit) {
    limits l;
    l.max_fields = 1;
    limit_enforcer e{l};
    ASSERT_TRUE(e.begin_part("a", false, "text/plain", nullptr).has_value());
    e.end_part();
    auto second = e.begin_part("b", false, "text/plain", nullptr);
    ASSERT_FALSE(second.has_value());
    ASSERT_TRUE(second.error().is(errc::too_many_fields));
}

TEST(global_mime_allowlist) {
    limits l;
    l.allowed_mime_types = {"image/*"};
    limit_enforcer e{l};
    ASSERT_TRUE(e.begin_part("a", true, "image/png", nullptr).has_value());
    e.end_part();
    auto bad = e.begin_part("b", true, "application/x-sh", nullptr);
    ASSERT_FALSE(bad.has_value());
    ASSERT_TRUE(bad.error().is(errc::disallowed_mime_type));
    ASSERT_EQ(bad.error().field, std::string("b"));

    // 白名单只约束文件
    ASSERT_TRUE(e.begin_part("t", false, "application/json", nullptr).has_value());
}

TEST(rule_overrides_mime_and_size) {
    limits l;
    l.allowed_mime_types = {"image/*"};
    l.max_file_size = 100;
    auto rule = field_rule::single("doc").with_mime_types({"application/pdf"}).with_max_size(8);
    limit_enforcer e{l};

    ASSERT_FALSE(e.begin_part("doc", true, "image/png", &rule).has_value());
    ASSERT_TRUE(e.begin_part("doc", true, "application/pdf", &rule).has_value());
    ASSERT_TRUE(e.part_limit() == std::optional<std::uint64_t>{8});
    ASSERT_TRUE(e.on_part_data(8).has_value());
    ASSERT_FALSE(e.on_part_data(1).has_value());
}

TEST(no_limits_configured) {
    limits l;
    limit_enforcer e{l};
    ASSERT_TRUE(e.on_body_chunk(1u << 30).has_value());
    ASSERT_TRUE(e.begin_part("a", true, "x/y", nullptr).has_value());
    ASSERT_TRUE(e.on_part_data(1u << 30).has_value());
    ASSERT_FALSE(e.part_limit().has_value());
}

RUN_TESTS()
