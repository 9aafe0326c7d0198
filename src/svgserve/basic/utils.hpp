#pragma once
#include <string>

#define S_UNUSED(x) (void)x

namespace SvgServe
{

class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

public:
    NonCopyable(const NonCopyable&)            = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
};

namespace Utils
{
// linux limits thread names to 15 characters, longer names are truncated
void SetThreadName(const std::string& name);
} // namespace Utils

} // namespace SvgServe
