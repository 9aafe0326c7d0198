#include "http/http_server.hpp"
#include "network/io_context_pool.hpp"
#include "network/services/svg_dir/svg_request_handler.hpp"
#include "svg_test_tree.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <map>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "svgserve/basic/log.h"
#include "svgserve/basic/string_utils.hpp"

using namespace network;
using namespace network::svg_dir;

namespace
{
struct raw_response {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string raw;
};

raw_response parse_response(const std::string& raw) {
    raw_response ret;
    ret.raw       = raw;
    auto head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) return ret;
    ret.body = raw.substr(head_end + 4);
    std::size_t line_start = 0;
    bool status_line       = true;
    while (line_start < head_end) {
        auto line_end = raw.find("\r\n", line_start);
        auto line     = raw.substr(line_start, line_end - line_start);
        line_start    = line_end + 2;
        if (status_line) {
            status_line = false;
            // "HTTP/1.1 200 OK"
            ret.status = std::stoi(line.substr(9, 3));
            continue;
        }
        auto colon = line.find(": ");
        if (colon == std::string::npos) continue;
        auto name = line.substr(0, colon);
        SvgServe::StringToLower(name);
        ret.headers[name] = line.substr(colon + 2);
    }
    return ret;
}

class SvgDirServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto http_config         = to_http_server_config(config);
        http_config.port         = 0;
        http_config.timeout_msec = 2000;
        server                   = http::http_server::make_shared(http_config, pool);
        server->set_handler(svg_request_handler(config));
        server->start();
        pool.start();
        port = server->local_endpoint().port();
    }
    void TearDown() override {
        server->stop();
        pool.stop();
        pool.join();
    }

    // send raw bytes, read until the server closes the connection
    std::string exchange(const std::string& request) {
        asio::io_context io;
        asio::ip::tcp::socket socket(io);
        socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        asio::write(socket, asio::buffer(request));
        std::string response;
        std::array<char, 4096> buf;
        asio::error_code ec;
        while (true) {
            auto n = socket.read_some(asio::buffer(buf), ec);
            response.append(buf.data(), n);
            if (ec) break;
        }
        EXPECT_EQ(ec, asio::error::eof);
        return response;
    }

    raw_response get(const std::string& target, const std::string& method = "GET") {
        return parse_response(exchange(method + " " + target + " HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n"));
    }

    svg_test_tree tree;
    svg_dir_config config = tree.config();
    io_context_pool pool { 2 };
    std::shared_ptr<http::http_server> server;
    std::uint16_t port = 0;
};
} // namespace

TEST_F(SvgDirServerTest, ListensOnEphemeralPort) {
    EXPECT_NE(port, 0);
    EXPECT_TRUE(server->local_endpoint().address().is_loopback());
}

TEST_F(SvgDirServerTest, ServeSvg) {
    auto response = get("/circle.svg");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.headers["content-type"], "image/svg+xml");
    EXPECT_EQ(response.headers["content-length"], std::to_string(std::string(svg_test_tree::kCircleSvg).size()));
    EXPECT_EQ(response.headers["connection"], "close");
    EXPECT_EQ(response.body, svg_test_tree::kCircleSvg);
}

TEST_F(SvgDirServerTest, RootRedirect) {
    auto response = get("/");
    EXPECT_EQ(response.status, 307);
    EXPECT_EQ(response.headers["location"], "/home");
    EXPECT_EQ(response.headers["content-length"], "0");
    EXPECT_TRUE(response.body.empty());
}

TEST_F(SvgDirServerTest, NotFound) {
    for (auto target : { "/missing.svg", "/../secret.txt", "/%2e%2e/secret.txt", "/icons/%2E%2E/%2e%2e/secret.txt",
                         "/icons", "/icons/", "/escape" }) {
        auto response = get(target);
        EXPECT_EQ(response.status, 404) << target;
        EXPECT_EQ(response.body, "404 Not Found") << target;
        EXPECT_EQ(response.raw.find("top secret"), std::string::npos) << target;
    }
}

TEST_F(SvgDirServerTest, EncodedPathIsDecoded) {
    auto response = get("/icons/st%61r.svg");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, svg_test_tree::kStarSvg);
}

TEST_F(SvgDirServerTest, MethodNotAllowed) {
    for (auto method : { "POST", "PUT", "DELETE", "HEAD" }) {
        auto response = get("/circle.svg", method);
        EXPECT_EQ(response.status, 405) << method;
        EXPECT_EQ(response.headers["allow"], "GET");
        EXPECT_TRUE(response.body.empty());
    }
}

TEST_F(SvgDirServerTest, MalformedRequest) {
    auto response = parse_response(exchange("GARBAGE\r\n\r\n"));
    EXPECT_EQ(response.status, 400);
    response = parse_response(exchange("GET /%zz HTTP/1.1\r\n\r\n"));
    EXPECT_EQ(response.status, 400);
    response = parse_response(exchange("POST / HTTP/1.1\r\nContent-Length: 2000000\r\n\r\n"));
    EXPECT_EQ(response.status, 400);
}

TEST_F(SvgDirServerTest, RequestSplitAcrossWrites) {
    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    asio::write(socket, asio::buffer(std::string("GET /circle.s")));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    asio::write(socket, asio::buffer(std::string("vg HTTP/1.1\r\nHost: x\r\n\r\n")));
    std::string raw;
    asio::error_code ec;
    asio::read(socket, asio::dynamic_buffer(raw), ec);
    EXPECT_EQ(ec, asio::error::eof);
    auto response = parse_response(raw);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, svg_test_tree::kCircleSvg);
}

TEST_F(SvgDirServerTest, ConcurrentClients) {
    std::vector<std::thread> clients;
    std::atomic<int> ok_count = 0;
    for (int i = 0; i < 8; ++i) {
        clients.emplace_back([&, i] {
            auto response = parse_response(exchange(i % 2 ? "GET /circle.svg HTTP/1.1\r\n\r\n"
                                                          : "GET /icons/star.svg HTTP/1.1\r\n\r\n"));
            if (response.status == 200) ++ok_count;
        });
    }
    for (auto& c : clients)
        c.join();
    EXPECT_EQ(ok_count.load(), 8);
}

TEST_F(SvgDirServerTest, IdleConnectionIsClosed) {
    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    auto start = std::chrono::steady_clock::now();
    std::string raw;
    asio::error_code ec;
    // nothing is sent, the server closes after one or two timeout periods
    asio::read(socket, asio::dynamic_buffer(raw), ec);
    EXPECT_EQ(ec, asio::error::eof);
    EXPECT_TRUE(raw.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST_F(SvgDirServerTest, SlowReaderGetsWholeResponse) {
    // larger than the loopback socket buffers, the write stays pending while the client sleeps
    std::string large = "<svg xmlns=\"http://www.w3.org/2000/svg\">";
    large.append(16 * 1024 * 1024, ' ');
    large += "</svg>";
    svg_test_tree::write(tree.root / "large.svg", large);

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.open(asio::ip::tcp::v4());
    socket.set_option(asio::socket_base::receive_buffer_size(4096));
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    asio::write(socket, asio::buffer(std::string("GET /large.svg HTTP/1.1\r\n\r\n")));
    // longer than two idle periods of the server
    std::this_thread::sleep_for(std::chrono::milliseconds(5000));
    std::string raw;
    asio::error_code ec;
    asio::read(socket, asio::dynamic_buffer(raw), ec);
    EXPECT_EQ(ec, asio::error::eof);
    auto response = parse_response(raw);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body.size(), large.size());
}

TEST(HttpServerBindTest, InvalidAddressThrows) {
    io_context_pool pool(1);
    http::http_server_config config;
    config.port         = 0;
    config.bind_address = "not-an-ip";
    EXPECT_THROW(http::http_server::make_shared(config, pool), std::system_error);
}

TEST(HttpServerBindTest, PortInUseThrows) {
    io_context_pool pool(1);
    http::http_server_config config;
    config.port = 0;
    auto first  = http::http_server::make_shared(config, pool);
    config.port = first->local_endpoint().port();
    EXPECT_THROW(http::http_server::make_shared(config, pool), std::system_error);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    SvgServe::Logger::LoggerInitOptions options;
    options.minimumLevel = SvgServe::LogLevel::debug;
    SvgServe::Logger::Initialize(std::move(options));
    return RUN_ALL_TESTS();
}
