#include "network/services/svg_dir/path_resolver.hpp"
#include "svg_test_tree.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

using namespace network::svg_dir;

namespace
{
// puts the original mode back when the test ends
struct file_mode_restorer {
    file_mode_restorer(std_fs::path file, ::mode_t mode) : file(std::move(file)), mode(mode) {
    }
    ~file_mode_restorer() {
        ::chmod(file.c_str(), mode);
    }
    std_fs::path file;
    ::mode_t mode;
};
} // namespace

class PathResolverTest : public ::testing::Test {
protected:
    svg_test_tree tree;
    svg_dir_config config = tree.config();
};

TEST_F(PathResolverTest, RootRedirectsToIndex) {
    EXPECT_EQ(resolve("/", config), resolution(redirect_resolution { "/home" }));
}

TEST_F(PathResolverTest, RootRedirectWinsOverExistingIndexFile) {
    svg_test_tree::write(tree.root / "home", "<svg/>");
    std_fs::create_directory(tree.root / "gallery");
    EXPECT_EQ(resolve("/", config), resolution(redirect_resolution { "/home" }));
    auto other = tree.config("gallery");
    EXPECT_EQ(resolve("/", other), resolution(redirect_resolution { "/gallery" }));
}

TEST_F(PathResolverTest, ServeExistingFile) {
    auto r = resolve("/circle.svg", config);
    ASSERT_TRUE(std::holds_alternative<serve_resolution>(r));
    EXPECT_EQ(std::get<serve_resolution>(r).file_path, std_fs::canonical(tree.root / "circle.svg"));
    EXPECT_EQ(resolution_name(r), "Serve");
}

TEST_F(PathResolverTest, ServeNestedFile) {
    auto r = resolve("/icons/star.svg", config);
    ASSERT_TRUE(std::holds_alternative<serve_resolution>(r));
    EXPECT_EQ(std::get<serve_resolution>(r).file_path, tree.root / "icons" / "star.svg");
}

TEST_F(PathResolverTest, SymlinkInsideRootIsFollowed) {
    auto r = resolve("/inner/star.svg", config);
    ASSERT_TRUE(std::holds_alternative<serve_resolution>(r));
    EXPECT_EQ(std::get<serve_resolution>(r).file_path, tree.root / "icons" / "star.svg");
}

TEST_F(PathResolverTest, MissingFileIsNotFound) {
    EXPECT_EQ(resolve("/missing.svg", config), resolution(not_found_resolution {}));
    EXPECT_EQ(resolve("/icons/missing.svg", config), resolution(not_found_resolution {}));
    EXPECT_EQ(resolve("/circle.svg/more", config), resolution(not_found_resolution {}));
}

TEST_F(PathResolverTest, DirectoryIsNotFound) {
    EXPECT_EQ(resolve("/icons", config), resolution(not_found_resolution {}));
    EXPECT_EQ(resolve("/icons/", config), resolution(not_found_resolution {}));
    EXPECT_EQ(resolve("/inner", config), resolution(not_found_resolution {}));
}

TEST_F(PathResolverTest, EmptyOrSlashOnlyIsNotFound) {
    EXPECT_EQ(resolve("", config), resolution(not_found_resolution {}));
    EXPECT_EQ(resolve("//", config), resolution(not_found_resolution {}));
    EXPECT_EQ(resolve("///", config), resolution(not_found_resolution {}));
    EXPECT_EQ(resolve("/.", config), resolution(not_found_resolution {}));
}

TEST_F(PathResolverTest, TraversalIsNotFound) {
    for (auto path : { "/../secret.txt", "/icons/../../secret.txt", "/icons/../icons/../../secret.txt",
                       "/./../secret.txt", "/..", "/../root/../secret.txt", "../secret.txt" }) {
        EXPECT_EQ(resolve(path, config), resolution(not_found_resolution {})) << path;
    }
}

TEST_F(PathResolverTest, TraversalBackIntoRootIsServed) {
    auto r = resolve("/icons/../circle.svg", config);
    ASSERT_TRUE(std::holds_alternative<serve_resolution>(r));
    EXPECT_EQ(std::get<serve_resolution>(r).file_path, tree.root / "circle.svg");
}

TEST_F(PathResolverTest, SymlinkEscapingRootIsNotFound) {
    EXPECT_EQ(resolve("/escape", config), resolution(not_found_resolution {}));
}

TEST_F(PathResolverTest, AbsoluteLookingPathStaysUnderRoot) {
    EXPECT_EQ(resolve("//etc/passwd", config), resolution(not_found_resolution {}));
    auto secret = (tree.base / "secret.txt").string();
    EXPECT_EQ(resolve("/" + secret, config), resolution(not_found_resolution {}));
    auto r = resolve("//circle.svg", config);
    EXPECT_TRUE(std::holds_alternative<serve_resolution>(r));
}

TEST_F(PathResolverTest, NulByteIsNotFound) {
    std::string path("/circle.svg");
    path.push_back('\0');
    path += ".txt";
    EXPECT_EQ(resolve(path, config), resolution(not_found_resolution {}));
}

TEST_F(PathResolverTest, QueryStringIsIgnored) {
    auto r = resolve("/circle.svg?size=10", config);
    ASSERT_TRUE(std::holds_alternative<serve_resolution>(r));
    EXPECT_EQ(std::get<serve_resolution>(r).file_path, tree.root / "circle.svg");
}

TEST_F(PathResolverTest, TrailingSlashOnFile) {
    auto r = resolve("/circle.svg/", config);
    EXPECT_TRUE(std::holds_alternative<serve_resolution>(r));
}

TEST_F(PathResolverTest, UnreadableFileIsNotFound) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root can read any file";
    }
    auto locked = tree.root / "locked.svg";
    svg_test_tree::write(locked, "<svg/>");
    file_mode_restorer restore(locked, S_IRUSR | S_IWUSR);
    ASSERT_EQ(::chmod(locked.c_str(), 0), 0);
    EXPECT_EQ(resolve("/locked.svg", config), resolution(not_found_resolution {}));
}

TEST_F(PathResolverTest, Idempotent) {
    for (auto path : { "/", "/circle.svg", "/missing.svg", "/../secret.txt" }) {
        auto first = resolve(path, config);
        for (int i = 0; i < 5; ++i) {
            EXPECT_EQ(resolve(path, config), first) << path;
        }
    }
}

TEST(StrictDescendantTest, ComponentWise) {
    EXPECT_TRUE(is_strict_descendant("/srv/svg", "/srv/svg/a.svg"));
    EXPECT_TRUE(is_strict_descendant("/srv/svg", "/srv/svg/icons/a.svg"));
    EXPECT_TRUE(is_strict_descendant("/srv/svg/", "/srv/svg/a.svg"));
    EXPECT_TRUE(is_strict_descendant("/", "/etc"));
    EXPECT_FALSE(is_strict_descendant("/srv/svg", "/srv/svg"));
    EXPECT_FALSE(is_strict_descendant("/srv/svg", "/srv/svg/"));
    EXPECT_FALSE(is_strict_descendant("/srv/svg", "/srv/svgs/a.svg"));
    EXPECT_FALSE(is_strict_descendant("/srv/svg", "/srv"));
    EXPECT_FALSE(is_strict_descendant("/srv/svg", "/etc/passwd"));
    EXPECT_FALSE(is_strict_descendant("/", "/"));
}

TEST(ResolutionNameTest, Names) {
    EXPECT_EQ(resolution_name(redirect_resolution { "/home" }), "Redirect");
    EXPECT_EQ(resolution_name(not_found_resolution {}), "NotFound");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
