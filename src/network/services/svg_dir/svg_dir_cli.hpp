#pragma once
#include "svg_dir_config.hpp"

#include "svgserve/basic/arg_parser.hpp"

namespace network
{
namespace svg_dir
{
constexpr const char* kSvgDirServerVersion = "1.0.0";

// printed in the help page and once at startup
constexpr const char* kSvgDirUsageGuide =
    "svg_dir_server serves the svg files of one directory over http.\n"
    "  svg_dir_server [options] [path]      path defaults to the current directory\n"
    "  GET /                                redirects to the --index route\n"
    "  GET /<name>.svg                      the file's bytes as image/svg+xml\n"
    "  GET /<dir>/<name>.svg                files in sub directories work the same way\n"
    "Only GET is answered. Names are case-sensitive and must include the .svg suffix.\n"
    "Requests never leave the served directory, symlinks pointing outside are not found.";

constexpr const char* kBindOptionName    = "bind";
constexpr const char* kPortOptionName    = "port";
constexpr const char* kIndexOptionName   = "index";
constexpr const char* kThreadsOptionName = "threads";
constexpr const char* kTimeoutOptionName = "timeout";
constexpr const char* kLogDirOptionName  = "log-dir";
constexpr const char* kVerboseOptionName = "verbose";

// register every svg_dir_server option, help and version are registered by arg_parser itself
void add_svg_dir_options(SvgServe::arg_parser& parser);

// collect parsed values over the defaults, throw std::invalid_argument for extra positional params
svg_dir_options read_svg_dir_options(const SvgServe::arg_parser& parser);

} // namespace svg_dir
} // namespace network
