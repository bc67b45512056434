#include "sigid/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__)
#include <string.h>
#elif defined(__APPLE__)
#include <cstring>
#else
#error Unsupported platform
#endif

namespace sigid::security
{

#if defined(__APPLE__)
namespace
{
// No explicit_bzero here; a call through a volatile pointer cannot be proven to be memset and elided.
void* (*const volatile g_memsetFn)(void*, int, std::size_t){ std::memset };
} // namespace
#endif

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#elif defined(__APPLE__)
    (void)g_memsetFn(bytes.data(), 0, bytes.size());
#else
    ::explicit_bzero(bytes.data(), bytes.size());
#endif
}

} // namespace sigid::security
