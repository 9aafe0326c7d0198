#include "http_request.hpp"

#include <algorithm>

#include "svgserve/basic/string_utils.hpp"
#include "svgserve/basic/url_utils.hpp"

namespace network::http
{

std::tuple<std::optional<bool>, const char*> http_request::parse(const char* begin, const char* end) {
    auto leftSize = static_cast<std::size_t>(end - begin);
    while (begin != end) {
        std::optional<bool> result = consume(&begin, &leftSize);
        if (result.has_value() /*result || !result*/) {
            if (result.value() && !handler_parse_success()) {
                return std::make_tuple(std::optional<bool>(false), begin);
            }
            return std::make_tuple(result, begin);
        }
    }
    return std::make_tuple(std::nullopt, begin);
}

bool http_request::handler_parse_success() {
    auto indexQ = uri_.find_first_of('?');
    pattern_    = uri_.substr(0, indexQ);
    queryStr_   = (indexQ != std::string::npos) ? uri_.substr(indexQ + 1) : std::string();

    auto decoded = SvgServe::UrlDecode(pattern_);
    if (!decoded.has_value()) return false;
    path_ = std::move(decoded.value());
    return true;
}

std::optional<bool> http_request::isDataTransmissionFinishWhenParseAllHeader() {
    if (contentLength_ != kInvalidHttpContentLength) {
        if (contentTransferred_ >= contentLength_) return true;
        return std::nullopt;
    }
    contentLength_ = 0;
    for (auto& it : headers_) {
        if (!SvgServe::StringEqualsIgnoreCase(it.name, "Content-Length")) continue;
        if (!SvgServe::StringIsDigits(it.value) || it.value.size() > 8) return false;
        contentLength_ = std::stoul(it.value);
        if (contentLength_ > kMaxHttpContentLength) return false;
        break;
    }
    if (contentTransferred_ >= contentLength_) return true;
    return std::nullopt;
}

std::optional<bool> http_request::consume(const char** ppInput, std::size_t* pLeftSize) {
    char input = *(*ppInput);
    if (state_ != body) { // Not body state,comsume one by one
        ++(*ppInput);
        --(*pLeftSize);
    }
    switch (state_) {
    case state::method_start:
        if (!IsChar(input) || IsCtl(input) || IsTspecial(input)) {
            return false;
        } else {
            state_ = state::method;
            method_.push_back(input);
            return std::nullopt;
        }
    case state::method:
        if (input == ' ') {
            state_ = state::uri;
            return std::nullopt;
        } else if (!IsChar(input) || IsCtl(input) || IsTspecial(input)) {
            return false;
        } else {
            method_.push_back(input);
            return std::nullopt;
        }
    case state::uri:
        if (input == ' ') {
            if (uri_.empty()) return false;
            state_ = http_version_h;
            return std::nullopt;
        } else if (IsCtl(input)) {
            return false;
        } else {
            uri_.push_back(input);
            return std::nullopt;
        }
    case state::http_version_h:
        if (input == 'H') {
            state_ = state::http_version_t_1;
            return std::nullopt;
        } else {
            return false;
        }
    case state::http_version_t_1:
        if (input == 'T') {
            state_ = state::http_version_t_2;
            return std::nullopt;
        } else {
            return false;
        }
    case state::http_version_t_2:
        if (input == 'T') {
            state_ = state::http_version_p;
            return std::nullopt;
        } else {
            return false;
        }
    case state::http_version_p:
        if (input == 'P') {
            state_ = state::http_version_slash;
            return std::nullopt;
        } else {
            return false;
        }
    case state::http_version_slash:
        if (input == '/') {
            http_version_major_ = 0;
            http_version_minor_ = 0;
            state_              = state::http_version_major_start;
            return std::nullopt;
        } else {
            return false;
        }
    case state::http_version_major_start:
        if (IsDigit(input)) {
            http_version_major_ = http_version_major_ * 10 + input - '0';
            state_              = state::http_version_major;
            return std::nullopt;
        } else {
            return false;
        }
    case state::http_version_major:
        if (input == '.') {
            state_ = state::http_version_minor_start;
            return std::nullopt;
        } else if (IsDigit(input) && http_version_major_ < 100) {
            http_version_major_ = http_version_major_ * 10 + input - '0';
            return std::nullopt;
        } else {
            return false;
        }
    case state::http_version_minor_start:
        if (IsDigit(input)) {
            http_version_minor_ = http_version_minor_ * 10 + input - '0';
            state_              = state::http_version_minor;
            return std::nullopt;
        } else {
            return false;
        }
    case state::http_version_minor:
        if (input == '\r') {
            state_ = state::expecting_newline_1;
            return std::nullopt;
        } else if (IsDigit(input) && http_version_minor_ < 100) {
            http_version_minor_ = http_version_minor_ * 10 + input - '0';
            return std::nullopt;
        } else {
            return false;
        }
    case state::expecting_newline_1:
        if (input == '\n') {
            state_ = state::header_line_start;
            return std::nullopt;
        } else {
            return false;
        }
    case state::header_line_start:
        if (input == '\r') {
            state_ = state::expecting_newline_3;
            return std::nullopt;
        } else if (!headers_.empty() && (input == ' ' || input == '\t')) {
            state_ = state::header_lws;
            return std::nullopt;
        } else if (!IsChar(input) || IsCtl(input) || IsTspecial(input)) {
            return false;
        } else {
            headers_.emplace_back();
            headers_.back().name.push_back(input);
            state_ = header_name;
            return std::nullopt;
        }
    case state::header_lws:
        if (input == '\r') {
            state_ = state::expecting_newline_2;
            return std::nullopt;
        } else if (input == ' ' || input == '\t') {
            return std::nullopt;
        } else if (IsCtl(input)) {
            return false;
        } else {
            state_ = state::header_value;
            headers_.back().value.push_back(input);
            return std::nullopt;
        }
    case state::header_name:
        if (input == ':') {
            state_ = state::space_before_header_value;
            return std::nullopt;
        } else if (!IsChar(input) || IsCtl(input) || IsTspecial(input)) {
            return false;
        } else {
            headers_.back().name.push_back(input);
            return std::nullopt;
        }
    case state::space_before_header_value:
        if (input == ' ' || input == '\t') {
            return std::nullopt;
        } else if (input == '\r') {
            state_ = state::expecting_newline_2;
            return std::nullopt;
        } else if (IsCtl(input)) {
            return false;
        } else {
            state_ = state::header_value;
            headers_.back().value.push_back(input);
            return std::nullopt;
        }
    case state::header_value:
        if (input == '\r') {
            state_ = state::expecting_newline_2;
            return std::nullopt;
        } else if (IsCtl(input)) {
            return false;
        } else {
            headers_.back().value.push_back(input);
            return std::nullopt;
        }
    case state::expecting_newline_2:
        if (input == '\n') {
            state_ = state::header_line_start;
            return std::nullopt;
        } else {
            return false;
        }
    case state::expecting_newline_3: {
        contentTransferred_ = 0;
        if (input != '\n') return false;
        auto result = isDataTransmissionFinishWhenParseAllHeader();
        if (result.has_value()) return result;
        // Ready to append body data
        state_ = state::body;
        return std::nullopt;
    }
    case state::body: {
        // bytes after the declared body belong to nothing, one request per connection
        auto size = std::min(*pLeftSize, contentLength_ - contentTransferred_);
        contentTransferred_ += size;
        (*ppInput) += size;
        (*pLeftSize) -= size;
        return isDataTransmissionFinishWhenParseAllHeader();
    }
    default: return false;
    }
}

bool http_request::IsChar(int c) {
    return c >= 0 && c <= 127;
}

bool http_request::IsCtl(int c) {
    return (c >= 0 && c <= 31) || (c == 127);
}

bool http_request::IsTspecial(int c) {
    switch (c) {
    case '(':
    case ')':
    case '<':
    case '>':
    case '@':
    case ',':
    case ';':
    case ':':
    case '\\':
    case '"':
    case '/':
    case '[':
    case ']':
    case '?':
    case '=':
    case '{':
    case '}':
    case ' ':
    case '\t': return true;
    default: return false;
    }
}

bool http_request::IsDigit(int c) {
    return c >= '0' && c <= '9';
}

const std::string& http_request::get_ip() const {
    return ip_;
}

std::int32_t http_request::get_port() const {
    return port_;
}

} // namespace network::http
