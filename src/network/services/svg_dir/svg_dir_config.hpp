#pragma once
#include <cstdint>
#include <string>

#include "http/http_definitions.hpp"
#include "svgserve/basic/filesystem_utils.hpp"

namespace network
{
namespace svg_dir
{
// raw values as they come from the command line
struct svg_dir_options {
    std::string bind_address = "127.0.0.1";
    std::string port         = "5000";
    std::string index_route  = "/home";
    std::string root_dir     = ".";
    // empty means hardware concurrency
    std::string threads;
    std::string timeout_msec = "30000";
};

// validated server configuration, never mutated after make_svg_dir_config returns
struct svg_dir_config {
    std::string bind_address;
    std::uint16_t port = 0;
    // always starts with '/'
    std::string index_route;
    // absolute and canonical
    std_fs::path root_dir;
    std::size_t threads      = 1;
    std::size_t timeout_msec = 0;
};

// throw std::invalid_argument naming the first invalid value
svg_dir_config make_svg_dir_config(const svg_dir_options& options);

http::http_server_config to_http_server_config(const svg_dir_config& config);

} // namespace svg_dir
} // namespace network
