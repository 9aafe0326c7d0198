#include "http_definitions.hpp"

#include <unordered_map>

namespace network::http
{

static const std::unordered_map<std::string, MethodFilter> s_method_str_2_filter = {
    { "GET", MethodFilter::HttpGet },         { "HEAD", MethodFilter::HttpHead },
    { "POST", MethodFilter::HttpPost },       { "PUT", MethodFilter::HttpPut },
    { "DELETE", MethodFilter::HttpDelete },   { "CONNECT", MethodFilter::HttpConnect },
    { "OPTIONS", MethodFilter::HttpOptions }, { "TRACE", MethodFilter::HttpTrace },
    { "PATCH", MethodFilter::HttpPatch },
};

MethodFilter from_method_string(const std::string& httpMethod) {
    auto iter = s_method_str_2_filter.find(httpMethod);
    if (iter != s_method_str_2_filter.end()) {
        return iter->second;
    }
    return MethodFilter::HttpNone;
}

} // namespace network::http
