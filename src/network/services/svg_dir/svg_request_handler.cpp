#include "svg_request_handler.hpp"

#include "svgserve/basic/filesystem_utils.hpp"
#include "svgserve/basic/log.h"

namespace network::svg_dir
{
using http::http_response;

namespace
{
struct response_builder {
    http_response operator()(const redirect_resolution& r) const {
        SDEBUG("redirecting / to {}", r.to);
        http_response response;
        response.set_status(http_response::temporary_redirect);
        response.add_header("Location", r.to);
        return response;
    }
    http_response operator()(const serve_resolution& r) const {
        SDEBUG("loading svg at {}", r.file_path.string());
        http_response response;
        std::string content;
        if (!SvgServe::fs::ReadFile(r.file_path.native(), content)) {
            SWARN("read {} failed after it was resolved", r.file_path.string());
            response.stock_response(http_response::internal_server_error);
            return response;
        }
        response.set_status(http_response::ok);
        response.set_raw_content_type(kSvgMimeType);
        response.set_body(std::move(content));
        return response;
    }
    http_response operator()(const not_found_resolution&) const {
        http_response response;
        response.stock_response(http_response::not_found);
        response.set_body("404 Not Found");
        return response;
    }
};
} // namespace

svg_request_handler::svg_request_handler(const svg_dir_config& config, resolver_function resolver) :
config_(config), resolver_(std::move(resolver)) {
    SASSERT(resolver_, "svg_request_handler needs a resolver");
}

http_response svg_request_handler::handle(const std::string& method, const std::string& request_path) const {
    // method tokens are case-sensitive, "get" is not GET
    if (http::from_method_string(method) != http::MethodFilter::HttpGet) {
        http_response response;
        response.set_status(http_response::method_not_allowed);
        response.add_header("Allow", "GET");
        return response;
    }
    return std::visit(response_builder {}, resolver_(request_path, config_));
}

void svg_request_handler::operator()(http_response& response, const http::http_request& request) const {
    response = handle(request.get_method_str(), request.get_path());
}

http_response handle(const std::string& method, const std::string& request_path, const svg_dir_config& config) {
    return svg_request_handler(config).handle(method, request_path);
}

} // namespace network::svg_dir
