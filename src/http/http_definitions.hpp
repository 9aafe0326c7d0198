#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace network::http
{
enum MethodFilter : std::uint32_t
{
    HttpNone    = 0,
    HttpGet     = (1U << 0),
    HttpHead    = (1U << 1),
    HttpPost    = (1U << 2),
    HttpPut     = (1U << 3),
    HttpDelete  = (1U << 4),
    HttpConnect = (1U << 5),
    HttpOptions = (1U << 6),
    HttpTrace   = (1U << 7),
    HttpPatch   = (1U << 8),
};

/// Convert a request method token into a MethodFilter, unknown methods map to HttpNone.
/// Method tokens are case-sensitive.
MethodFilter from_method_string(const std::string& httpMethod);

struct http_header {
    std::string name;
    std::string value;
};

struct http_server_config {
    std::string bind_address = "127.0.0.1";
    // 0 lets the system choose a free port
    std::uint16_t port       = 5000;
    // idle connection timeout, 0 disables it
    std::size_t timeout_msec = 30000;
};

static constexpr std::size_t kInvalidHttpContentLength = std::numeric_limits<std::size_t>::max();
// requests declaring a larger body are rejected before it is buffered
static constexpr std::size_t kMaxHttpContentLength = 1024 * 1024;
static constexpr std::size_t kHttpReadBufferSize   = 8192;

} // namespace network::http
