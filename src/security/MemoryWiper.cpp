#include "cloak/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__APPLE__)
#define __STDC_WANT_LIB_EXT1__ 1
#include <string.h>
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace cloak::security
{
void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#elif defined(__APPLE__)
    // memset_s is not allowed to be optimized away; it only fails on invalid arguments.
    static_cast<void>(::memset_s(bytes.data(), bytes.size(), 0, bytes.size()));
#elif defined(__NetBSD__)
    ::explicit_memset(bytes.data(), 0, bytes.size());
#else
    ::explicit_bzero(bytes.data(), bytes.size());
#endif
}
} // namespace cloak::security
