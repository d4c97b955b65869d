/// formflow unit tests — part header block parsing, Content-Disposition

#include "test_framework.hpp"

#include <formflow/core/error.hpp>
#include <formflow/multipart/header_values.hpp>
#include <formflow/multipart/part_headers.hpp>

#include <string>

using namespace formflow;
using namespace formflow::multipart;

// =============================================================================
// Content-Disposition
// =============================================================================

TEST(disposition_name_and_filename) {
    auto cd = parse_content_disposition("form-data; name=\"upload\"; filename=\"my file.txt\"");
    ASSERT_EQ(cd.type, std::string("form-data"));
    ASSERT_TRUE(cd.name.has_value());
    ASSERT_EQ(*cd.name, std::string("upload"));
    ASSERT_TRUE(cd.has_filename());
    ASSERT_EQ(*cd.effective_filename(), std::string("my file.txt"));
}

TEST(disposition_escaped_quotes) {
    auto cd = parse_content_disposition(R"(form-data; name="a\"b"; filename="c\\d.txt")");
    ASSERT_EQ(*cd.name, std::string("a\"b"));
    ASSERT_EQ(*cd.filename, std::string("c\\d.txt"));
}

TEST(disposition_filename_star_preferred) {
    auto cd = parse_content_disposition(
        "form-data; name=\"doc\"; filename=\"fallback.txt\"; filename*=UTF-8''%E6%96%87%E4%BB%B6.txt");
    ASSERT_TRUE(cd.filename_star.has_value());
    ASSERT_EQ(*cd.effective_filename(), std::string("\xE6\x96\x87\xE4\xBB\xB6.txt"));
    ASSERT_EQ(*cd.filename, std::string("fallback.txt"));
}

TEST(disposition_unquoted_values) {
    auto cd = parse_content_disposition("form-data; name=title");
    ASSERT_EQ(*cd.name, std::string("title"));
    ASSERT_FALSE(cd.has_filename());
}

TEST(disposition_case_insensitive_params) {
    auto cd = parse_content_disposition("Form-Data; NAME=\"x\"; FileName=\"y\"");
    ASSERT_EQ(cd.type, std::string("form-data"));
    ASSERT_EQ(*cd.name, std::string("x"));
    ASSERT_EQ(*cd.filename, std::string("y"));
}

// =============================================================================
// split_header_lines
// =============================================================================

TEST(split_basic_lines) {
    auto h = split_header_lines("A: 1\r\nB:2 \r\nC:   three");
    ASSERT_TRUE(h.has_value());
    ASSERT_EQ(h->entries.size(), 3u);
    ASSERT_EQ(std::string(*h->find("a")), std::string("1"));
    ASSERT_EQ(std::string(*h->find("B")), std::string("2"));
    ASSERT_EQ(std::string(*h->find("c")), std::string("three"));
    ASSERT_FALSE(h->find("D").has_value());
}

TEST(split_continuation_line) {
    auto h = split_header_lines("X-Long: first\r\n  second\r\n\tthird");
    ASSERT_TRUE(h.has_value());
    ASSERT_EQ(h->entries.size(), 1u);
    ASSERT_EQ(h->entries[0].second, std::string("first second third"));
}

TEST(split_rejects_line_without_colon) {
    auto h = split_header_lines("Content-Disposition: form-data\r\ngarbage line");
    ASSERT_FALSE(h.has_value());
    ASSERT_EQ(h.error(), make_error_code(errc::invalid_header));
}

TEST(split_rejects_empty_name) {
    auto h = split_header_lines(": value");
    ASSERT_FALSE(h.has_value());
    ASSERT_EQ(h.error(), make_error_code(errc::invalid_header));
}

TEST(split_rejects_leading_continuation) {
    auto h = split_header_lines(" orphan continuation");
    ASSERT_FALSE(h.has_value());
    ASSERT_EQ(h.error(), make_error_code(errc::invalid_header));
}

TEST(split_first_duplicate_wins) {
    auto h = split_header_lines("Content-Type: text/a\r\ncontent-type: text/b");
    ASSERT_TRUE(h.has_value());
    ASSERT_EQ(std::string(*h->find("Content-Type")), std::string("text/a"));
}

// =============================================================================
// parse_part_headers
// =============================================================================

TEST(part_text_field_defaults) {
    auto p = parse_part_headers("Content-Disposition: form-data; name=\"title\"");
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->field_name, std::string("title"));
    ASSERT_FALSE(p->is_file());
    ASSERT_EQ(p->content_type, std::string("text/plain"));
}

TEST(part_file_defaults_to_octet_stream) {
    auto p = parse_part_headers("Content-Disposition: form-data; name=\"f\"; filename=\"a.bin\"");
    ASSERT_TRUE(p.has_value());
    ASSERT_TRUE(p->is_file());
    ASSERT_EQ(*p->file_name, std::string("a.bin"));
    ASSERT_EQ(p->content_type, std::string("application/octet-stream"));
}

TEST(part_content_type_normalized) {
    auto p = parse_part_headers(
        "content-disposition: form-data; name=\"img\"; filename=\"x.PNG\"\r\n"
        "CONTENT-TYPE: Image/PNG; charset=binary");
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->content_type, std::string("image/png"));
    ASSERT_EQ(*p->file_name, std::string("x.PNG"));
}

TEST(part_empty_filename_is_still_file) {
    auto p = parse_part_headers("Content-Disposition: form-data; name=\"f\"; filename=\"\"");
    ASSERT_TRUE(p.has_value());
    ASSERT_TRUE(p->is_file());
    ASSERT_TRUE(p->file_name->empty());
}

TEST(part_missing_disposition) {
    auto p = parse_part_headers("Content-Type: text/plain");
    ASSERT_FALSE(p.has_value());
    ASSERT_EQ(p.error(), make_error_code(errc::missing_field_name));
}

TEST(part_missing_name) {
    auto p = parse_part_headers("Content-Disposition: form-data; filename=\"a.txt\"");
    ASSERT_FALSE(p.has_value());
    ASSERT_EQ(p.error(), make_error_code(errc::missing_field_name));
}

TEST(part_empty_name) {
    auto p = parse_part_headers("Content-Disposition: form-data; name=\"\"");
    ASSERT_FALSE(p.has_value());
    ASSERT_EQ(p.error(), make_error_code(errc::missing_field_name));
}

TEST(part_empty_block) {
    auto p = parse_part_headers("");
    ASSERT_FALSE(p.has_value());
    ASSERT_EQ(p.error(), make_error_code(errc::missing_field_name));
}

TEST(part_headers_kept_in_order) {
    auto p = parse_part_headers(
        "Content-Disposition: form-data; name=\"a\"\r\nX-Custom: 1\r\nX-Other: 2");
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->headers.entries.size(), 3u);
    ASSERT_EQ(p->headers.entries[1].first, std::string("X-Custom"));
}

RUN_TESTS()
