#pragma once
#include <functional>
#include <string>

#include "http/http_request.hpp"
#include "http/http_response.hpp"
#include "path_resolver.hpp"
#include "svg_dir_config.hpp"

namespace network
{
namespace svg_dir
{
constexpr const char* kSvgMimeType = "image/svg+xml";

using resolver_function = std::function<resolution(const std::string&, const svg_dir_config&)>;

/// Turns a method and a decoded request path into a response. It's stateless apart from
/// the immutable config, so one instance serves every connection concurrently.
class svg_request_handler {
public:
    explicit svg_request_handler(const svg_dir_config& config, resolver_function resolver = resolve);

    // never throws for filesystem failures, they become 404 or 500
    http::http_response handle(const std::string& method, const std::string& request_path) const;

    // adapter for http::http_handler
    void operator()(http::http_response& response, const http::http_request& request) const;

    const svg_dir_config& config() const {
        return config_;
    }

private:
    const svg_dir_config& config_;
    resolver_function resolver_;
};

http::http_response handle(const std::string& method, const std::string& request_path, const svg_dir_config& config);

} // namespace svg_dir
} // namespace network
