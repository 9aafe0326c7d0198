#include "utils.hpp"

#if defined(__linux__)
    #include <pthread.h>
#endif

namespace SvgServe
{
namespace Utils
{

void SetThreadName(const std::string& name) {
#if defined(__linux__)
    ::pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#else
    S_UNUSED(name);
#endif
}

} // namespace Utils
} // namespace SvgServe
