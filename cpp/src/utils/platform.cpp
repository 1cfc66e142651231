/**
 * @file platform.cpp
 * @brief Cross-platform implementations of the `nodebus::platform` helpers: process and
 *        thread ids, executable name, version information and monotonic time.
 */
#include "nb_base.hpp"
#include "nodebus_version.h"

#include <chrono>
#include <thread>
#include <vector>

#if defined(NODEBUS_IS_POSIX)
#include <climits>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(NODEBUS_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#include <pthread.h>
#endif

namespace nodebus::platform
{

uint64_t get_pid()
{
#if defined(NODEBUS_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(NODEBUS_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(NODEBUS_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(NODEBUS_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(NODEBUS_PLATFORM_WIN64)
        std::vector<char> buf(MAX_PATH);
        DWORD len = GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0)
        {
            return "unknown_win";
        }
        full_path.assign(buf.data(), len);
#elif defined(NODEBUS_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(NODEBUS_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                full_path = buf.data();
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#else
        (void)include_path;
        return "unknown";
#endif
        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

int get_version_major() noexcept
{
    return NODEBUS_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return NODEBUS_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return NODEBUS_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return NODEBUS_VERSION_STRING;
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace nodebus::platform
