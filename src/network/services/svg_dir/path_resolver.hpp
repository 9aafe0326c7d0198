#pragma once
#include <string>
#include <string_view>
#include <variant>

#include "svg_dir_config.hpp"

namespace network
{
namespace svg_dir
{
// the request path is exactly "/"
struct redirect_resolution {
    std::string to;
    bool operator==(const redirect_resolution& other) const {
        return to == other.to;
    }
};

// an existing readable regular file strictly inside the root
struct serve_resolution {
    std_fs::path file_path;
    bool operator==(const serve_resolution& other) const {
        return file_path == other.file_path;
    }
};

struct not_found_resolution {
    bool operator==(const not_found_resolution&) const {
        return true;
    }
};

using resolution = std::variant<redirect_resolution, serve_resolution, not_found_resolution>;

/// Map a decoded request path to a resolution. Only filesystem metadata is touched,
/// nothing throws and nothing is cached.
resolution resolve(const std::string& request_path, const svg_dir_config& config);

/// Component-wise check that candidate lies below root. Both must be canonical,
/// root itself is not a strict descendant.
bool is_strict_descendant(const std_fs::path& root, const std_fs::path& candidate);

std::string_view resolution_name(const resolution& r);

} // namespace svg_dir
} // namespace network
