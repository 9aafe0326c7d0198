#include "http/http_request.hpp"
#include "http/http_response.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace network::http;

namespace
{
std::optional<bool> feed(http_request& request, const std::string& data) {
    auto [result, consumed] = request.parse(data.data(), data.data() + data.size());
    (void)consumed;
    return result;
}

std::string flatten(const std::vector<asio::const_buffer>& buffers) {
    std::string ret;
    for (auto& b : buffers)
        ret.append(static_cast<const char*>(b.data()), b.size());
    return ret;
}
} // namespace

TEST(HttpRequestTest, ParseCompleteRequest) {
    http_request request;
    auto result = feed(request, "GET /icons/star.svg?size=2&x=y HTTP/1.1\r\n"
                                "Host: 127.0.0.1:5000\r\n"
                                "User-Agent: curl/8.0\r\n"
                                "\r\n");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(request.get_method_str(), "GET");
    EXPECT_EQ(from_method_string(request.get_method_str()), MethodFilter::HttpGet);
    EXPECT_EQ(request.get_uri(), "/icons/star.svg?size=2&x=y");
    EXPECT_EQ(request.get_pattern(), "/icons/star.svg");
    EXPECT_EQ(request.get_path(), "/icons/star.svg");
    EXPECT_EQ(request.get_query_str(), "size=2&x=y");
    EXPECT_EQ(request.get_http_version_major(), 1);
    EXPECT_EQ(request.get_http_version_minor(), 1);
    EXPECT_EQ(request.get_content_length(), 0u);
}

TEST(HttpRequestTest, ContentLengthNameIsCaseInsensitive) {
    http_request request;
    ASSERT_EQ(feed(request, "POST / HTTP/1.0\r\nX-Other: 1\r\ncOnTeNt-LeNgTh: 3\r\n\r\nabc"),
              std::optional<bool>(true));
    EXPECT_EQ(request.get_content_length(), 3u);
}

TEST(HttpRequestTest, MethodTokens) {
    EXPECT_EQ(from_method_string("GET"), MethodFilter::HttpGet);
    EXPECT_EQ(from_method_string("HEAD"), MethodFilter::HttpHead);
    EXPECT_EQ(from_method_string("PATCH"), MethodFilter::HttpPatch);
    EXPECT_EQ(from_method_string("get"), MethodFilter::HttpNone);
    EXPECT_EQ(from_method_string("BREW"), MethodFilter::HttpNone);
    EXPECT_EQ(from_method_string(""), MethodFilter::HttpNone);
}

TEST(HttpRequestTest, IncrementalFeeding) {
    const std::string raw = "GET /circle.svg HTTP/1.1\r\nHost: localhost\r\nAccept: */*\r\n\r\n";
    http_request request;
    for (std::size_t i = 0; i + 1 < raw.size(); ++i) {
        auto result = feed(request, raw.substr(i, 1));
        ASSERT_FALSE(result.has_value()) << "at byte " << i;
    }
    auto result = feed(request, raw.substr(raw.size() - 1));
    ASSERT_EQ(result, std::optional<bool>(true));
    EXPECT_EQ(request.get_path(), "/circle.svg");
    EXPECT_EQ(request.get_http_version_minor(), 1);
}

TEST(HttpRequestTest, PercentDecodedPath) {
    http_request request;
    ASSERT_EQ(feed(request, "GET /%2e%2e/secret%20file.txt HTTP/1.1\r\n\r\n"), std::optional<bool>(true));
    EXPECT_EQ(request.get_pattern(), "/%2e%2e/secret%20file.txt");
    EXPECT_EQ(request.get_path(), "/../secret file.txt");
}

TEST(HttpRequestTest, PlusIsNotSpace) {
    http_request request;
    ASSERT_EQ(feed(request, "GET /a+b.svg HTTP/1.1\r\n\r\n"), std::optional<bool>(true));
    EXPECT_EQ(request.get_path(), "/a+b.svg");
}

TEST(HttpRequestTest, InvalidEscapeIsRejected) {
    for (auto raw : { "GET /bad%zz.svg HTTP/1.1\r\n\r\n", "GET /bad%4 HTTP/1.1\r\n\r\n" }) {
        http_request request;
        EXPECT_EQ(feed(request, raw), std::optional<bool>(false)) << raw;
    }
}

TEST(HttpRequestTest, MalformedRequestLine) {
    for (auto raw : { "GET\r\n\r\n", "GET /  HTTP/1.1\r\n\r\n", "GET / FTP/1.1\r\n\r\n", "GET / HTTP/x.1\r\n\r\n",
                      "G(T / HTTP/1.1\r\n\r\n", "GET / HTTP/1.1\n\n", " GET / HTTP/1.1\r\n\r\n",
                      "GET / HTTP/1.1\r\nBad Header: x\r\n\r\n" }) {
        http_request request;
        EXPECT_EQ(feed(request, raw), std::optional<bool>(false)) << raw;
    }
}

TEST(HttpRequestTest, NonGetMethodsAreParsed) {
    http_request request;
    ASSERT_EQ(feed(request, "DELETE /circle.svg HTTP/1.1\r\n\r\n"), std::optional<bool>(true));
    EXPECT_EQ(from_method_string(request.get_method_str()), MethodFilter::HttpDelete);
    http_request unknown;
    ASSERT_EQ(feed(unknown, "BREW /pot HTTP/1.1\r\n\r\n"), std::optional<bool>(true));
    EXPECT_EQ(from_method_string(unknown.get_method_str()), MethodFilter::HttpNone);
    EXPECT_EQ(unknown.get_method_str(), "BREW");
}

TEST(HttpRequestTest, BodyWithContentLength) {
    http_request request;
    EXPECT_FALSE(feed(request, "POST /x HTTP/1.1\r\ncontent-length: 10\r\n\r\n01234").has_value());
    EXPECT_EQ(feed(request, "56789"), std::optional<bool>(true));
    EXPECT_EQ(request.get_content_length(), 10u);
}

TEST(HttpRequestTest, ExtraBytesAfterBodyAreIgnored) {
    http_request request;
    EXPECT_EQ(feed(request, "POST /x HTTP/1.1\r\nContent-Length: 3\r\n\r\nabcdef"), std::optional<bool>(true));
    EXPECT_EQ(request.get_content_length(), 3u);
}

TEST(HttpRequestTest, OversizedOrInvalidBodyIsRejected) {
    {
        http_request request;
        auto raw = "POST /x HTTP/1.1\r\nContent-Length: " + std::to_string(kMaxHttpContentLength + 1) + "\r\n\r\n";
        EXPECT_EQ(feed(request, raw), std::optional<bool>(false));
    }
    {
        http_request request;
        EXPECT_EQ(feed(request, "POST /x HTTP/1.1\r\nContent-Length: -1\r\n\r\n"), std::optional<bool>(false));
    }
    {
        http_request request;
        EXPECT_EQ(feed(request, "POST /x HTTP/1.1\r\nContent-Length: 99999999999999999999\r\n\r\n"),
                  std::optional<bool>(false));
    }
}

TEST(HttpResponseTest, SerializeAddsTransportHeaders) {
    http_response response;
    response.set_status(http_response::temporary_redirect);
    response.add_header("Location", "/home");
    auto text = flatten(response.to_buffers());
    EXPECT_EQ(text, "HTTP/1.1 307 Temporary Redirect\r\n"
                    "Location: /home\r\n"
                    "Content-Length: 0\r\n"
                    "Connection: close\r\n"
                    "\r\n");
    // a second serialization doesn't duplicate headers
    EXPECT_EQ(flatten(response.to_buffers()), text);
}

TEST(HttpResponseTest, StockResponse) {
    http_response response;
    response.add_header("X-Stale", "1");
    response.stock_response(http_response::bad_request);
    EXPECT_EQ(response.get_status(), http_response::bad_request);
    EXPECT_EQ(response.get_body(), "Bad Request");
    EXPECT_TRUE(response.get_header("X-Stale").empty());
    EXPECT_EQ(response.get_header("content-type"), "text/plain; charset=utf-8");
    auto text = flatten(response.to_buffers());
    EXPECT_NE(text.find("Content-Length: 11\r\n"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 11), "Bad Request");
}

TEST(HttpResponseTest, ContentTypeIsReplaced) {
    http_response response;
    response.set_raw_content_type("text/plain");
    response.set_raw_content_type("image/svg+xml");
    EXPECT_EQ(response.get_headers().size(), 1u);
    EXPECT_EQ(response.get_header("Content-Type"), "image/svg+xml");
    EXPECT_EQ(http_response::status_reason(http_response::method_not_allowed), "Method Not Allowed");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
