#include "network/services/svg_dir/svg_request_handler.hpp"
#include "svg_test_tree.hpp"

#include <atomic>

#include <gtest/gtest.h>

using namespace network::svg_dir;
using network::http::http_response;

class SvgRequestHandlerTest : public ::testing::Test {
protected:
    svg_test_tree tree;
    svg_dir_config config = tree.config();
};

TEST_F(SvgRequestHandlerTest, NonGetIsRejectedWithoutResolving) {
    std::atomic<int> resolver_calls = 0;
    svg_request_handler handler(config, [&](const std::string& path, const svg_dir_config& c) {
        ++resolver_calls;
        return resolve(path, c);
    });
    for (auto method : { "POST", "PUT", "DELETE", "HEAD", "PATCH", "OPTIONS", "get", "BREW" }) {
        for (auto path : { "/", "/circle.svg", "/missing.svg", "/../secret.txt" }) {
            auto response = handler.handle(method, path);
            EXPECT_EQ(response.get_status(), http_response::method_not_allowed) << method << " " << path;
            EXPECT_EQ(response.get_header("Allow"), "GET");
            EXPECT_TRUE(response.get_body().empty());
        }
    }
    EXPECT_EQ(resolver_calls, 0);
    handler.handle("GET", "/circle.svg");
    EXPECT_EQ(resolver_calls, 1);
}

TEST_F(SvgRequestHandlerTest, RootRedirects) {
    auto response = handle("GET", "/", config);
    EXPECT_EQ(response.get_status(), http_response::temporary_redirect);
    EXPECT_EQ(response.get_header("Location"), "/home");
    EXPECT_EQ(response.get_header("location"), "/home");
    EXPECT_TRUE(response.get_body().empty());
}

TEST_F(SvgRequestHandlerTest, ServesSvg) {
    auto response = handle("GET", "/circle.svg", config);
    EXPECT_EQ(response.get_status(), http_response::ok);
    EXPECT_EQ(response.get_header("Content-Type"), kSvgMimeType);
    EXPECT_EQ(response.get_body(), svg_test_tree::kCircleSvg);
}

TEST_F(SvgRequestHandlerTest, ServesEmptyFile) {
    svg_test_tree::write(tree.root / "empty.svg", "");
    auto response = handle("GET", "/empty.svg", config);
    EXPECT_EQ(response.get_status(), http_response::ok);
    EXPECT_TRUE(response.get_body().empty());
}

TEST_F(SvgRequestHandlerTest, NotFoundCases) {
    for (auto path : { "/missing.svg", "/../secret.txt", "/icons", "/icons/", "/escape", "" }) {
        auto response = handle("GET", path, config);
        EXPECT_EQ(response.get_status(), http_response::not_found) << path;
        EXPECT_EQ(response.get_body(), "404 Not Found");
        EXPECT_EQ(response.get_body().find("secret"), std::string::npos);
    }
}

TEST_F(SvgRequestHandlerTest, VanishedFileIsInternalError) {
    auto vanished = tree.root / "vanished.svg";
    // resolved while the file existed, removed before the body is read
    svg_request_handler handler(config, [&](const std::string&, const svg_dir_config&) -> resolution {
        return serve_resolution { vanished };
    });
    auto response = handler.handle("GET", "/vanished.svg");
    EXPECT_EQ(response.get_status(), http_response::internal_server_error);
    EXPECT_EQ(response.get_body().find(tree.root.string()), std::string::npos);
    EXPECT_EQ(response.get_body().find("vanished"), std::string::npos);
    EXPECT_FALSE(response.get_body().empty());
}

TEST_F(SvgRequestHandlerTest, AdapterUsesDecodedPath) {
    network::http::http_request request;
    std::string raw = "GET /ci%72cle.svg?x=1 HTTP/1.1\r\nHost: localhost\r\n\r\n";
    auto [result, consumed] = request.parse(raw.data(), raw.data() + raw.size());
    ASSERT_TRUE(result.has_value() && result.value());
    EXPECT_EQ(consumed, raw.data() + raw.size());

    http_response response;
    svg_request_handler handler(config);
    handler(response, request);
    EXPECT_EQ(response.get_status(), http_response::ok);
    EXPECT_EQ(response.get_body(), svg_test_tree::kCircleSvg);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
