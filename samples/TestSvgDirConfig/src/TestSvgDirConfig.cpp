#include "network/services/svg_dir/svg_dir_config.hpp"
#include "svg_test_tree.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

using namespace network::svg_dir;

class SvgDirConfigTest : public ::testing::Test {
protected:
    svg_dir_options valid_options() const {
        svg_dir_options options;
        options.root_dir = tree.root.string();
        return options;
    }
    svg_test_tree tree;
};

TEST_F(SvgDirConfigTest, Defaults) {
    auto config = make_svg_dir_config(valid_options());
    EXPECT_EQ(config.bind_address, "127.0.0.1");
    EXPECT_EQ(config.port, 5000);
    EXPECT_EQ(config.index_route, "/home");
    EXPECT_EQ(config.root_dir, tree.root);
    EXPECT_GE(config.threads, 1u);
    EXPECT_EQ(config.timeout_msec, 30000u);
}

TEST_F(SvgDirConfigTest, DefaultRootIsCurrentDirectory) {
    svg_dir_options options;
    auto config = make_svg_dir_config(options);
    EXPECT_EQ(config.root_dir, std_fs::canonical(std_fs::current_path()));
}

TEST_F(SvgDirConfigTest, RootIsCanonicalized) {
    auto options     = valid_options();
    options.root_dir = (tree.root / "icons" / ".." / "inner" / "..").string();
    EXPECT_EQ(make_svg_dir_config(options).root_dir, tree.root);
    options.root_dir = (tree.root / "inner").string();
    EXPECT_EQ(make_svg_dir_config(options).root_dir, tree.root / "icons");
}

TEST_F(SvgDirConfigTest, BindAddress) {
    auto options = valid_options();
    for (auto address : { "0.0.0.0", "::", "::1", "192.168.1.10" }) {
        options.bind_address = address;
        EXPECT_NO_THROW(make_svg_dir_config(options)) << address;
    }
    for (auto address : { "", "localhost", "256.0.0.1", "1.2.3", "127.0.0.1:80", "example.com" }) {
        options.bind_address = address;
        EXPECT_THROW(make_svg_dir_config(options), std::invalid_argument) << address;
    }
}

TEST_F(SvgDirConfigTest, Port) {
    auto options = valid_options();
    const std::vector<std::pair<std::string, std::uint16_t>> valid_ports { { "1", 1 }, { "80", 80 }, { "65535", 65535 } };
    for (auto& [text, value] : valid_ports) {
        options.port = text;
        EXPECT_EQ(make_svg_dir_config(options).port, value);
    }
    for (auto text : { "", "0", "65536", "-1", "+80", "80a", " 80", "99999999999999999999999" }) {
        options.port = text;
        EXPECT_THROW(make_svg_dir_config(options), std::invalid_argument) << text;
    }
}

TEST_F(SvgDirConfigTest, IndexRouteGetsLeadingSlash) {
    auto options        = valid_options();
    options.index_route = "gallery";
    EXPECT_EQ(make_svg_dir_config(options).index_route, "/gallery");
    options.index_route = "/already";
    EXPECT_EQ(make_svg_dir_config(options).index_route, "/already");
    options.index_route = "";
    EXPECT_EQ(make_svg_dir_config(options).index_route, "/");
}

TEST_F(SvgDirConfigTest, RootMustBeExistingDirectory) {
    auto options     = valid_options();
    options.root_dir = (tree.root / "missing").string();
    EXPECT_THROW(make_svg_dir_config(options), std::invalid_argument);
    options.root_dir = (tree.root / "circle.svg").string();
    EXPECT_THROW(make_svg_dir_config(options), std::invalid_argument);
}

TEST_F(SvgDirConfigTest, ThreadsAndTimeout) {
    auto options         = valid_options();
    options.threads      = "4";
    options.timeout_msec = "0";
    auto config          = make_svg_dir_config(options);
    EXPECT_EQ(config.threads, 4u);
    EXPECT_EQ(config.timeout_msec, 0u);
    options.threads = "0";
    EXPECT_THROW(make_svg_dir_config(options), std::invalid_argument);
    options.threads      = "2";
    options.timeout_msec = "-5";
    EXPECT_THROW(make_svg_dir_config(options), std::invalid_argument);
}

TEST_F(SvgDirConfigTest, HttpServerConfig) {
    auto options         = valid_options();
    options.bind_address = "::1";
    options.port         = "8080";
    options.timeout_msec = "100";
    auto http_config     = to_http_server_config(make_svg_dir_config(options));
    EXPECT_EQ(http_config.bind_address, "::1");
    EXPECT_EQ(http_config.port, 8080);
    EXPECT_EQ(http_config.timeout_msec, 100u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
