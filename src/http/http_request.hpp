#pragma once
#include "http_definitions.hpp"

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace network
{
namespace http
{
class http_connection;
/// request from remote,owned by a http connection
class http_request {
    friend class http_connection;

public:
    http_request() = default;

    // bytes of the declared body that arrived, the body itself is dropped
    std::size_t get_content_length() const {
        return contentTransferred_;
    }
    // Gets client's ip. It's ipv6 string if it's ipv6 type
    const std::string& get_ip() const;
    // Gets client's port
    std::int32_t get_port() const;
    // Gets query str
    const std::string& get_query_str() const {
        return queryStr_;
    }
    // get http request method_
    const std::string& get_method_str() const {
        return method_;
    }
    // get http request Uri
    const std::string& get_uri() const {
        return uri_;
    }
    // uri without query string, still percent-encoded
    const std::string& get_pattern() const {
        return pattern_;
    }
    // percent-decoded pattern
    const std::string& get_path() const {
        return path_;
    }
    int get_http_version_major() const {
        return http_version_major_;
    }
    int get_http_version_minor() const {
        return http_version_minor_;
    }

    /// Parse some data. The std::optional<bool> return value is true when a complete request
    /// has been parsed, false if the data is invalid, std::nullopt when more
    /// data is required. The pointer return value indicates how much of the
    /// input has been consumed.
    std::tuple<std::optional<bool>, const char*> parse(const char* begin, const char* end);

private:
    bool handler_parse_success();
    /// true when the whole body has arrived, std::nullopt when more is required,
    /// false when the declared length is invalid or too large
    std::optional<bool> isDataTransmissionFinishWhenParseAllHeader();
    /// Handle the next character of input.
    std::optional<bool> consume(const char** ppInput, std::size_t* pLeftSize);

    /// Check if a byte is an HTTP character.
    static bool IsChar(int c);

    /// Check if a byte is an HTTP control character.
    static bool IsCtl(int c);

    /// Check if a byte is defined as an HTTP tspecial character.
    static bool IsTspecial(int c);

    /// Check if a byte is a digit.
    static bool IsDigit(int c);

private:
    /// The current state of the parser.
    enum state
    {
        method_start,
        method,
        uri,
        http_version_h,
        http_version_t_1,
        http_version_t_2,
        http_version_p,
        http_version_slash,
        http_version_major_start,
        http_version_major,
        http_version_minor_start,
        http_version_minor,
        expecting_newline_1,
        header_line_start,
        header_lws,
        header_name,
        space_before_header_value,
        header_value,
        expecting_newline_2,
        expecting_newline_3,
        body // parse body state
    } state_ = method_start;

    std::string method_;
    std::string uri_;
    int http_version_major_ = 0;
    int http_version_minor_ = 0;
    std::vector<http_header> headers_;
    std::size_t contentTransferred_ = 0;
    std::size_t contentLength_      = kInvalidHttpContentLength;
    std::string ip_;        // remote client's ip,if it's ipv6,than it's ipv6 string
    std::int32_t port_ = 0; // remote client's port
    // generate helper data
    std::string pattern_;
    std::string path_;
    std::string queryStr_;
};
} // namespace http
} // namespace network
