#include "path_resolver.hpp"

#include <iterator>
#include <system_error>
#include <unistd.h>

#include "svgserve/basic/log.h"

namespace network::svg_dir
{

resolution resolve(const std::string& request_path, const svg_dir_config& config) {
    if (request_path == "/") return redirect_resolution { config.index_route };

    std::string_view relative(request_path);
    relative = relative.substr(0, relative.find('?'));
    if (relative.find('\0') != std::string_view::npos) return not_found_resolution {};
    while (!relative.empty() && relative.front() == '/')
        relative.remove_prefix(1);
    while (!relative.empty() && relative.back() == '/')
        relative.remove_suffix(1);
    if (relative.empty()) return not_found_resolution {};

    // canonicalize before any check, this resolves "..", "." and symlinks
    std::error_code ec;
    auto candidate = std_fs::canonical(config.root_dir / std_fs::path(relative), ec);
    if (ec) {
        STRACE("resolve {} failed:{}", request_path, ec.message());
        return not_found_resolution {};
    }
    if (!is_strict_descendant(config.root_dir, candidate)) {
        SDEBUG("reject {}, it escapes the root directory", request_path);
        return not_found_resolution {};
    }
    if (!std_fs::is_regular_file(candidate, ec) || ec) return not_found_resolution {};
    if (::access(candidate.c_str(), R_OK) != 0) return not_found_resolution {};
    return serve_resolution { std::move(candidate) };
}

bool is_strict_descendant(const std_fs::path& root, const std_fs::path& candidate) {
    auto root_iter      = root.begin();
    auto candidate_iter = candidate.begin();
    for (; root_iter != root.end(); ++root_iter, ++candidate_iter) {
        // "/srv/svg/" iterates with a trailing empty element
        if (root_iter->empty() && std::next(root_iter) == root.end()) break;
        if (candidate_iter == candidate.end() || *root_iter != *candidate_iter) return false;
    }
    for (; candidate_iter != candidate.end(); ++candidate_iter) {
        if (!candidate_iter->empty()) return true;
    }
    return false;
}

std::string_view resolution_name(const resolution& r) {
    struct visitor {
        std::string_view operator()(const redirect_resolution&) const {
            return "Redirect";
        }
        std::string_view operator()(const serve_resolution&) const {
            return "Serve";
        }
        std::string_view operator()(const not_found_resolution&) const {
            return "NotFound";
        }
    };
    return std::visit(visitor {}, r);
}

} // namespace network::svg_dir
