/// formflow unit tests — errc category, error kinds, upload_error wrapping

#include "test_framework.hpp"

#include <formflow/core/error.hpp>

#include <cerrno>
#include <string>
#include <system_error>

using namespace formflow;

TEST(error_category_name) {
    auto ec = make_error_code(errc::file_too_large);
    ASSERT_EQ(std::string(ec.category().name()), std::string("formflow"));
    ASSERT_EQ(ec.message(), std::string("file too large"));
}

TEST(error_code_enum_implicit_conversion) {
    std::error_code ec = errc::unexpected_eof;
    ASSERT_TRUE(ec == errc::unexpected_eof);
    ASSERT_TRUE(ec != errc::malformed_boundary);
    ASSERT_TRUE(static_cast<bool>(ec));

    std::error_code ok = errc::success;
    ASSERT_FALSE(static_cast<bool>(ok));
}

TEST(error_kind_groups) {
    ASSERT_TRUE(kind_of(errc::invalid_rule) == error_kind::config);
    ASSERT_TRUE(kind_of(errc::destination_unwritable) == error_kind::config);
    ASSERT_TRUE(kind_of(errc::malformed_boundary) == error_kind::parse);
    ASSERT_TRUE(kind_of(errc::header_too_large) == error_kind::parse);
    ASSERT_TRUE(kind_of(errc::body_stream_failed) == error_kind::parse);
    ASSERT_TRUE(kind_of(errc::file_too_large) == error_kind::limit);
    ASSERT_TRUE(kind_of(errc::unexpected_field) == error_kind::limit);
    ASSERT_TRUE(kind_of(errc::missing_required_field) == error_kind::limit);
    ASSERT_TRUE(kind_of(errc::no_space) == error_kind::storage);
    ASSERT_TRUE(kind_of(errc::cancelled) == error_kind::cancelled);
    ASSERT_TRUE(kind_of(errc::success) == error_kind::none);
}

TEST(error_kind_of_foreign_code_is_storage) {
    auto ec = std::make_error_code(std::errc::io_error);
    ASSERT_TRUE(kind_of(ec) == error_kind::storage);
    ASSERT_TRUE(kind_of(std::error_code{}) == error_kind::none);
}

TEST(error_kind_to_string) {
    ASSERT_EQ(to_string(error_kind::limit), std::string_view("limit"));
    ASSERT_EQ(to_string(error_kind::parse), std::string_view("parse"));
}

#ifndef FORMFLOW_PLATFORM_WINDOWS
TEST(error_from_native) {
    ASSERT_TRUE(from_native_error(0) == errc::success);
    ASSERT_TRUE(from_native_error(EACCES) == errc::permission_denied);
    ASSERT_TRUE(from_native_error(EEXIST) == errc::file_exists);
    ASSERT_TRUE(from_native_error(ENOSPC) == errc::no_space);
    ASSERT_TRUE(from_native_error(EIO) == errc::io_error);
}
#endif

TEST(wrap_error_keeps_formflow_codes) {
    auto err = wrap_error(make_error_code(errc::invalid_header), "avatar");
    ASSERT_TRUE(err.is(errc::invalid_header));
    ASSERT_EQ(err.field, std::string("avatar"));
    ASSERT_FALSE(static_cast<bool>(err.cause));
}

TEST(wrap_error_maps_native_and_keeps_cause) {
    auto native = std::make_error_code(std::errc::no_space_on_device);
    auto err = wrap_error(native, "upload");
    ASSERT_TRUE(err.is(errc::no_space));
    ASSERT_EQ(err.cause, native);
    ASSERT_TRUE(err.kind() == error_kind::storage);
}

TEST(wrap_error_unknown_native_is_io_error) {
    auto native = std::make_error_code(std::errc::bad_file_descriptor);
    auto err = wrap_error(native);
    ASSERT_TRUE(err.is(errc::io_error));
    ASSERT_EQ(err.cause, native);
}

TEST(upload_error_message_includes_context) {
    auto err = make_upload_error(errc::file_too_large, "avatar", 1024);
    auto msg = err.message();
    ASSERT_TRUE(msg.find("file too large") != std::string::npos);
    ASSERT_TRUE(msg.find("avatar") != std::string::npos);
    ASSERT_TRUE(msg.find("1024") != std::string::npos);
}

TEST(upload_error_message_includes_cause) {
    auto err = wrap_error(std::make_error_code(std::errc::permission_denied));
    auto msg = err.message();
    ASSERT_TRUE(msg.find("permission denied") != std::string::npos);
    ASSERT_TRUE(msg.find(err.cause.message()) != std::string::npos);
}

RUN_TESTS()
