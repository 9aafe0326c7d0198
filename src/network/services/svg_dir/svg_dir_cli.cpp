#include "svg_dir_cli.hpp"

#include <stdexcept>

#include "svgserve/basic/log.h"

namespace network::svg_dir
{
using SvgServe::arg_parser;

void add_svg_dir_options(arg_parser& parser) {
    const svg_dir_options defaults;
    parser.SetUsageGuide(kSvgDirUsageGuide);
    parser.AddOption(kBindOptionName, SvgServe::StringFormat("ip address to listen on, default:{}", defaults.bind_address),
                     'b', arg_parser::required_param, "address");
    parser.AddOption(kPortOptionName, SvgServe::StringFormat("port to listen on, default:{}", defaults.port), 'p',
                     arg_parser::required_param, "port");
    parser.AddOption(kIndexOptionName,
                     SvgServe::StringFormat("route that / redirects to, default:{}", defaults.index_route), 'i',
                     arg_parser::required_param, "route");
    parser.AddOption(kThreadsOptionName, "io threads, default:hardware concurrency", 't', arg_parser::required_param,
                     "number");
    parser.AddOption(kTimeoutOptionName,
                     SvgServe::StringFormat("idle connection timeout, 0 disables it, default:{}", defaults.timeout_msec),
                     arg_parser::kNoShortOption, arg_parser::required_param, "msec");
    parser.AddOption(kLogDirOptionName, "also write rotating log files into this directory", 'l',
                     arg_parser::required_param, "dir");
    parser.AddOption(kVerboseOptionName, "log at debug level", 'V');
}

svg_dir_options read_svg_dir_options(const arg_parser& parser) {
    svg_dir_options options;
    options.bind_address = parser.GetValue<std::string>(kBindOptionName, options.bind_address);
    options.port         = parser.GetValue<std::string>(kPortOptionName, options.port);
    options.index_route  = parser.GetValue<std::string>(kIndexOptionName, options.index_route);
    options.threads      = parser.GetValue<std::string>(kThreadsOptionName, options.threads);
    options.timeout_msec = parser.GetValue<std::string>(kTimeoutOptionName, options.timeout_msec);

    auto& positional = parser.GetNonOptionValues();
    if (positional.size() > 1) {
        throw std::invalid_argument(
            SvgServe::StringFormat("expect one directory at most, got {} positional params", positional.size()));
    }
    if (!positional.empty()) options.root_dir = positional.front();
    return options;
}

} // namespace network::svg_dir
