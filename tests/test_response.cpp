#include <gtest/gtest.h>

#include <string>

#include "pooled_http/response.hpp"

using namespace pooled_http;

namespace {

    http::fields fields_of(
        std::initializer_list<std::pair<const char*, const char*>> list) {
        http::fields f;
        for (auto const& [k, v] : list) f.insert(k, v);
        return f;
    }

}  // namespace

TEST(BodyCodingTest, SelectsTransferStage) {
    auto none = select_body_coding(fields_of({}));
    ASSERT_TRUE(none.has_value());
    EXPECT_EQ(none.value().transfer, TransferCoding::None);
    EXPECT_TRUE(none.value().known_empty());

    auto length = select_body_coding(fields_of({{"Content-Length", "10"}}));
    ASSERT_TRUE(length.has_value());
    EXPECT_EQ(length.value().transfer, TransferCoding::LengthLimited);
    EXPECT_EQ(length.value().content_length, 10u);
    EXPECT_FALSE(length.value().known_empty());

    // Transfer-Encoding wins over Content-Length.
    auto chunked = select_body_coding(fields_of(
        {{"Content-Length", "10"}, {"Transfer-Encoding", "Chunked"}}));
    ASSERT_TRUE(chunked.has_value());
    EXPECT_EQ(chunked.value().transfer, TransferCoding::Chunked);
}

TEST(BodyCodingTest, SelectsContentStage) {
    auto gzip = select_body_coding(
        fields_of({{"Content-Length", "3"}, {"Content-Encoding", "gzip"}}));
    ASSERT_TRUE(gzip.has_value());
    EXPECT_EQ(gzip.value().content, ContentCoding::Gzip);

    auto xgzip =
        select_body_coding(fields_of({{"Content-Encoding", "x-gzip"}}));
    ASSERT_TRUE(xgzip.has_value());
    EXPECT_EQ(xgzip.value().content, ContentCoding::Gzip);

    auto deflate =
        select_body_coding(fields_of({{"Content-Encoding", "deflate"}}));
    ASSERT_TRUE(deflate.has_value());
    EXPECT_EQ(deflate.value().content, ContentCoding::Deflate);

    auto identity =
        select_body_coding(fields_of({{"Content-Encoding", "identity"}}));
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity.value().content, ContentCoding::Identity);
}

TEST(BodyCodingTest, RejectsUnsupportedCodings) {
    auto br = select_body_coding(fields_of({{"Content-Encoding", "br"}}));
    ASSERT_TRUE(br.has_error());
    EXPECT_EQ(br.error().code, Error::Code::UnsupportedEncoding);
    EXPECT_NE(br.error().message.find("br"), std::string::npos);

    auto te = select_body_coding(
        fields_of({{"Transfer-Encoding", "gzip, chunked"}}));
    ASSERT_TRUE(te.has_error());
    EXPECT_EQ(te.error().code, Error::Code::UnsupportedEncoding);
    EXPECT_NE(te.error().message.find("gzip, chunked"), std::string::npos);
}

TEST(BodyCodingTest, ValidatesContentLength) {
    auto bad = select_body_coding(fields_of({{"Content-Length", "-1"}}));
    ASSERT_TRUE(bad.has_error());
    EXPECT_EQ(bad.error().code, Error::Code::ParseError);

    auto conflicting = select_body_coding(
        fields_of({{"Content-Length", "3"}, {"Content-Length", "4"}}));
    ASSERT_TRUE(conflicting.has_error());
    EXPECT_EQ(conflicting.error().code, Error::Code::ParseError);

    auto repeated = select_body_coding(
        fields_of({{"Content-Length", "4"}, {"Content-Length", "4"}}));
    ASSERT_TRUE(repeated.has_value());
    EXPECT_EQ(repeated.value().content_length, 4u);
}
