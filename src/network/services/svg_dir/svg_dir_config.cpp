#include "svg_dir_config.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <thread>

#include "network/use_asio.hpp"
#include "svgserve/basic/log.h"
#include "svgserve/basic/string_utils.hpp"
#include "svgserve/basic/url_utils.hpp"

namespace network::svg_dir
{

namespace
{
// digits only, no sign and no whitespace
std::uint64_t parse_unsigned(const std::string& name, const std::string& value, std::uint64_t max_value) {
    if (!SvgServe::StringIsDigits(value) || value.size() > 19) {
        throw std::invalid_argument(SvgServe::StringFormat("invalid {} \"{}\", expect an unsigned integer", name, value));
    }
    auto ret = std::stoull(value);
    if (ret > max_value) {
        throw std::invalid_argument(SvgServe::StringFormat("invalid {} \"{}\", it's larger than {}", name, value, max_value));
    }
    return ret;
}
} // namespace

svg_dir_config make_svg_dir_config(const svg_dir_options& options) {
    svg_dir_config config;

    asio::error_code ec;
    auto address = asio::ip::make_address(options.bind_address, ec);
    if (ec) {
        throw std::invalid_argument(
            SvgServe::StringFormat("invalid bind address \"{}\":{}", options.bind_address, ec.message()));
    }
    config.bind_address = address.to_string();

    config.port = static_cast<std::uint16_t>(
        parse_unsigned("port", options.port, std::numeric_limits<std::uint16_t>::max()));
    if (config.port == 0) {
        throw std::invalid_argument("invalid port \"0\", expect a value in [1,65535]");
    }

    config.index_route = SvgServe::CorrectApiSlash(options.index_route);

    std::error_code fs_ec;
    auto root = std_fs::canonical(options.root_dir.empty() ? "." : options.root_dir, fs_ec);
    if (fs_ec) {
        throw std::invalid_argument(
            SvgServe::StringFormat("invalid root directory \"{}\":{}", options.root_dir, fs_ec.message()));
    }
    if (!std_fs::is_directory(root, fs_ec)) {
        throw std::invalid_argument(SvgServe::StringFormat("root \"{}\" is not a directory", root.string()));
    }
    config.root_dir = std::move(root);

    if (options.threads.empty()) {
        config.threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    } else {
        config.threads = static_cast<std::size_t>(parse_unsigned("threads", options.threads, 1024));
        if (config.threads == 0) throw std::invalid_argument("invalid threads \"0\", need one at least");
    }

    config.timeout_msec = static_cast<std::size_t>(
        parse_unsigned("timeout", options.timeout_msec, std::numeric_limits<std::uint32_t>::max()));
    return config;
}

http::http_server_config to_http_server_config(const svg_dir_config& config) {
    http::http_server_config ret;
    ret.bind_address = config.bind_address;
    ret.port         = config.port;
    ret.timeout_msec = config.timeout_msec;
    return ret;
}

} // namespace network::svg_dir
