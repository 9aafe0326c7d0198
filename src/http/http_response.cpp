#include "http_response.hpp"

#include "svgserve/basic/string_utils.hpp"

namespace network::http
{

namespace StatusStrings
{

static constexpr std::string_view ok                    = "HTTP/1.1 200 OK\r\n";
static constexpr std::string_view moved_permanently     = "HTTP/1.1 301 Moved Permanently\r\n";
static constexpr std::string_view moved_temporarily     = "HTTP/1.1 302 Moved Temporarily\r\n";
static constexpr std::string_view temporary_redirect    = "HTTP/1.1 307 Temporary Redirect\r\n";
static constexpr std::string_view bad_request           = "HTTP/1.1 400 Bad Request\r\n";
static constexpr std::string_view forbidden             = "HTTP/1.1 403 Forbidden\r\n";
static constexpr std::string_view not_found             = "HTTP/1.1 404 Not Found\r\n";
static constexpr std::string_view method_not_allowed    = "HTTP/1.1 405 Method Not Allowed\r\n";
static constexpr std::string_view internal_server_error = "HTTP/1.1 500 Internal Server Error\r\n";
static constexpr std::string_view not_implemented       = "HTTP/1.1 501 Not Implemented\r\n";
static constexpr std::string_view service_unavailable   = "HTTP/1.1 503 Service Unavailable\r\n";
static constexpr std::string_view name_value_separator  = ": ";
static constexpr std::string_view crlf                  = "\r\n";
constexpr std::string_view status_to_buffer(http_response::response_type status) {
    switch (status) {
    case http_response::ok: return ok;
    case http_response::moved_permanently: return moved_permanently;
    case http_response::moved_temporarily: return moved_temporarily;
    case http_response::temporary_redirect: return temporary_redirect;
    case http_response::bad_request: return bad_request;
    case http_response::forbidden: return forbidden;
    case http_response::not_found: return not_found;
    case http_response::method_not_allowed: return method_not_allowed;
    case http_response::internal_server_error: return internal_server_error;
    case http_response::not_implemented: return not_implemented;
    case http_response::service_unavailable: return service_unavailable;
    default: return internal_server_error;
    }
}

} // namespace StatusStrings

std::string_view http_response::status_reason(response_type status) {
    auto line = StatusStrings::status_to_buffer(status);
    // "HTTP/1.1 " prefix and trailing crlf
    line.remove_prefix(9);
    line.remove_suffix(2);
    return line;
}

void http_response::stock_response(response_type status) {
    status_ = status;
    headers_.clear();
    set_raw_content_type("text/plain; charset=utf-8");
    body_ = std::string(status_reason(status));
}

void http_response::set_status(response_type status) {
    status_ = status;
}

http_response::response_type http_response::get_status() const {
    return status_;
}

void http_response::set_raw_content_type(const std::string& typeValue) {
    for (auto& h : headers_) {
        if (SvgServe::StringEqualsIgnoreCase(h.name, "Content-Type")) {
            h.value = typeValue;
            return;
        }
    }
    add_header("Content-Type", typeValue);
}

void http_response::add_header(const std::string& name, const std::string& value) {
    headers_.push_back(http_header { name, value });
}

const std::string& http_response::get_header(const std::string& name) const {
    for (auto& h : headers_) {
        if (SvgServe::StringEqualsIgnoreCase(h.name, name)) return h.value;
    }
    return default_str_;
}

const std::vector<http_header>& http_response::get_headers() const {
    return headers_;
}

void http_response::set_body(std::string body) {
    body_ = std::move(body);
}

const std::string& http_response::get_body() const {
    return body_;
}

std::vector<asio::const_buffer> http_response::to_buffers() {
    if (!transport_headers_added_) {
        transport_headers_added_ = true;
        add_header("Content-Length", std::to_string(body_.size()));
        add_header("Connection", "close");
    }
    std::vector<asio::const_buffer> buffers;
    buffers.reserve(headers_.size() * 4 + 3);
    buffers.push_back(asio::buffer(StatusStrings::status_to_buffer(status_)));
    for (std::size_t i = 0; i < headers_.size(); ++i) {
        http_header& h = headers_[i];
        buffers.push_back(asio::buffer(h.name));
        buffers.push_back(asio::buffer(StatusStrings::name_value_separator));
        buffers.push_back(asio::buffer(h.value));
        buffers.push_back(asio::buffer(StatusStrings::crlf));
    }
    buffers.push_back(asio::buffer(StatusStrings::crlf));
    if (!body_.empty()) buffers.push_back(asio::buffer(body_));
    return buffers;
}

} // namespace network::http
