#include <execd/core/utils.hpp>
#include <execd/core/errors.hpp>

#include <gtest/gtest.h>

using namespace execd;

TEST(UtilsTest, NormalizesPaths) {
    EXPECT_EQ("/a/c", normalize_path("/a/./b/../c"));
    EXPECT_EQ("/", normalize_path("/.."));
    EXPECT_EQ("../b", normalize_path("a/../../b"));
    EXPECT_EQ(".", normalize_path("a/.."));
    EXPECT_EQ("/x/y", normalize_path("//x//y/"));
}

TEST(UtilsTest, JoinsPaths) {
    EXPECT_EQ("/root/file", join_path("/root", "file"));
    EXPECT_EQ("/root/file", join_path("/root/", "/file"));
    EXPECT_EQ("/root/file", join_path("/root/", "file"));
    EXPECT_EQ("file", join_path("", "file"));
}

TEST(UtilsTest, SplitsAndTrims) {
    std::vector<std::string> parts = split("a,b,,c", ',');
    ASSERT_EQ(4u, parts.size());
    EXPECT_EQ("", parts[2]);
    EXPECT_EQ("a-b--c", join(parts, "-"));
    EXPECT_EQ("x y", trim("  x y\r\n"));
    EXPECT_TRUE(starts_with("execd", "exe"));
    EXPECT_TRUE(ends_with("history.db", ".db"));
    EXPECT_EQ("mixed", to_lower("MiXeD"));
}

TEST(UtilsTest, ParsesNumbersStrictly) {
    int64_t i = 0;
    EXPECT_TRUE(parse_int64(" 42 ", i));
    EXPECT_EQ(42, i);
    EXPECT_FALSE(parse_int64("42x", i));
    EXPECT_FALSE(parse_int64("", i));

    double d = 0;
    EXPECT_TRUE(parse_double("1.5", d));
    EXPECT_DOUBLE_EQ(1.5, d);
    EXPECT_FALSE(parse_double("one", d));
}

TEST(UtilsTest, DecodesUrlComponents) {
    EXPECT_EQ("/dir/a b.txt", url_decode("%2Fdir%2Fa+b.txt"));
    EXPECT_EQ("100%", url_decode("100%"));
}

TEST(UtilsTest, HoldsBackIncompleteUtf8) {
    EXPECT_EQ(3u, utf8_complete_prefix("abc"));
    EXPECT_EQ(1u, utf8_complete_prefix("a\xC3"));
    EXPECT_EQ(3u, utf8_complete_prefix("a\xC3\xA9"));
    EXPECT_EQ(0u, utf8_complete_prefix("\xE2\x82"));
    EXPECT_EQ(4u, utf8_complete_prefix("\xE2\x82\xAC!"));
    EXPECT_EQ(1u, utf8_complete_prefix("x\xF0\x9F\x98"));
}

TEST(UtilsTest, Base64MatchesKnownVectors) {
    EXPECT_EQ("aGVsbG8=", base64_encode("hello"));
    EXPECT_EQ("", base64_encode(""));

    std::string out;
    ASSERT_TRUE(base64_decode("aGVsbG8=", out));
    EXPECT_EQ("hello", out);
    ASSERT_TRUE(base64_decode("AAEC/w==", out));
    EXPECT_EQ(std::string("\x00\x01\x02\xff", 4), out);
    EXPECT_FALSE(base64_decode("abc", out));
}

TEST(UtilsTest, HashesAndCompares) {
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", sha256_hex("abc"));
    EXPECT_TRUE(secure_equals("token", "token"));
    EXPECT_FALSE(secure_equals("token", "token2"));
    EXPECT_FALSE(secure_equals("", "token"));
}

TEST(UtilsTest, GeneratesVersion4Uuids) {
    std::string a = generate_uuid();
    std::string b = generate_uuid();
    ASSERT_EQ(36u, a.size());
    EXPECT_EQ('-', a[8]);
    EXPECT_EQ('4', a[14]);
    EXPECT_NE(a, b);
}

TEST(UtilsTest, FormatsTimestamps) {
    EXPECT_EQ("1970-01-01T00:00:00Z", format_timestamp(0));
    EXPECT_EQ("2001-09-09T01:46:40Z", format_timestamp(1000000000));
}

TEST(ErrorsTest, MapsCodesToNamesAndStatuses) {
    EXPECT_STREQ("ValidationError", error_code_name(ErrorCode::ValidationError));
    EXPECT_STREQ("KernelCrashed", error_code_name(ErrorCode::KernelCrashed));
    EXPECT_EQ(400, error_code_http_status(ErrorCode::ValidationError));
    EXPECT_EQ(401, error_code_http_status(ErrorCode::Unauthorized));
    EXPECT_EQ(403, error_code_http_status(ErrorCode::PermissionDenied));
    EXPECT_EQ(404, error_code_http_status(ErrorCode::NotFound));
    EXPECT_EQ(504, error_code_http_status(ErrorCode::Timeout));
    EXPECT_EQ(500, error_code_http_status(ErrorCode::InternalError));

    OpResult<int> r = OpResult<int>::fail(OpStatus::fail(ErrorCode::Conflict, "exists"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(ErrorCode::Conflict, r.code);
    EXPECT_EQ("exists", r.error);
}
