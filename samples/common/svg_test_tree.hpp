#pragma once
#include <unistd.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include "network/services/svg_dir/svg_dir_config.hpp"
#include "svgserve/basic/filesystem_utils.hpp"

// A throwaway tree:
//   <base>/secret.txt
//   <base>/root/circle.svg
//   <base>/root/icons/star.svg
//   <base>/root/escape -> <base>/secret.txt
//   <base>/root/inner  -> <base>/root/icons
struct svg_test_tree {
    static constexpr const char* kCircleSvg =
        "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"10\" height=\"10\">"
        "<circle cx=\"5\" cy=\"5\" r=\"4\"/></svg>\n";
    static constexpr const char* kStarSvg = "<svg xmlns=\"http://www.w3.org/2000/svg\"><path d=\"M0 0\"/></svg>";

    svg_test_tree() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        base = std_fs::temp_directory_path() /
               ("svgserve_test_" + std::to_string(::getpid()) + "_" + std::to_string(stamp));
        std_fs::create_directories(base / "root" / "icons");
        base = std_fs::canonical(base);
        root = base / "root";
        write(base / "secret.txt", "top secret");
        write(root / "circle.svg", kCircleSvg);
        write(root / "icons" / "star.svg", kStarSvg);
        std_fs::create_symlink(base / "secret.txt", root / "escape");
        std_fs::create_directory_symlink(root / "icons", root / "inner");
    }
    ~svg_test_tree() {
        std::error_code ec;
        std_fs::remove_all(base, ec);
    }

    static void write(const std_fs::path& path, const std::string& content) {
        if (!SvgServe::fs::WriteFile(path.native(), content.data(), content.size())) {
            throw std::runtime_error("write test file failed:" + path.string());
        }
    }

    network::svg_dir::svg_dir_config config(const std::string& index = "/home") const {
        network::svg_dir::svg_dir_options options;
        options.root_dir    = root.string();
        options.index_route = index;
        options.threads     = "1";
        return network::svg_dir::make_svg_dir_config(options);
    }

    std_fs::path base;
    std_fs::path root;
};
