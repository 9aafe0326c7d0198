#pragma once
#include "http_definitions.hpp"

#include <string>
#include <string_view>
#include <vector>

#include "network/use_asio.hpp"

namespace network::http
{
/// response send to remote,filled by a request handler and serialized by a http connection
class http_response {
public:
    /// The status of the reply.
    enum response_type
    {
        ok                    = 200,
        moved_permanently     = 301,
        moved_temporarily     = 302,
        temporary_redirect    = 307,
        bad_request           = 400,
        forbidden             = 403,
        not_found             = 404,
        method_not_allowed    = 405,
        internal_server_error = 500,
        not_implemented       = 501,
        service_unavailable   = 503
    };

    /// Get a stock reply, a plain text body naming the status.
    void stock_response(response_type status);

    /// Set status code. if not set, default is ok.
    void set_status(response_type status);
    // Get current status
    response_type get_status() const;
    /// Set raw content-type.
    void set_raw_content_type(const std::string& typeValue);
    /// Add header info.
    void add_header(const std::string& name, const std::string& value);
    // Gets header value with the name, name is case-insensitive. empty when missing
    const std::string& get_header(const std::string& name) const;
    const std::vector<http_header>& get_headers() const;

    void set_body(std::string body);
    const std::string& get_body() const;

    /// pack status line, headers and body into buffers referencing this object.
    /// Content-Length and Connection headers are appended the first time it's called.
    std::vector<asio::const_buffer> to_buffers();

    static std::string_view status_reason(response_type status);

private:
    response_type status_ = response_type::ok;
    /// The headers to be included in the reply.
    std::vector<http_header> headers_;
    std::string body_;
    bool transport_headers_added_ = false;
    std::string default_str_;
};
} // namespace network::http
