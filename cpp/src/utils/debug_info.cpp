/**
 * @file debug_info.cpp
 * @brief Stack trace printing for NB_PANIC and fatal lifecycle errors.
 */
#include "nb_base.hpp"

#if defined(NODEBUS_PLATFORM_WIN64)
#include <dbghelp.h>
#pragma comment(lib, "dbghelp.lib")
#elif defined(NODEBUS_IS_POSIX)
#include <execinfo.h>
#include <unistd.h>
#endif

namespace nodebus::debug
{

namespace
{
constexpr int kMaxFrames = 64;
} // namespace

void print_stack_trace() noexcept
{
    std::fprintf(stderr, "Stack Trace (most recent call first):\n");
#if defined(NODEBUS_PLATFORM_WIN64)
    void *frames[kMaxFrames];
    const USHORT count = CaptureStackBackTrace(0, kMaxFrames, frames, nullptr);
    HANDLE process = GetCurrentProcess();
    SymInitialize(process, nullptr, TRUE);
    alignas(SYMBOL_INFO) char storage[sizeof(SYMBOL_INFO) + 256];
    auto *symbol = reinterpret_cast<SYMBOL_INFO *>(storage);
    symbol->MaxNameLen = 255;
    symbol->SizeOfStruct = sizeof(SYMBOL_INFO);
    for (USHORT i = 0; i < count; ++i)
    {
        if (SymFromAddr(process, reinterpret_cast<DWORD64>(frames[i]), nullptr, symbol))
        {
            std::fprintf(stderr, "  #%-2u %s\n", static_cast<unsigned>(i), symbol->Name);
        }
        else
        {
            std::fprintf(stderr, "  #%-2u %p\n", static_cast<unsigned>(i), frames[i]);
        }
    }
    SymCleanup(process);
#elif defined(NODEBUS_IS_POSIX)
    void *frames[kMaxFrames];
    const int count = backtrace(frames, kMaxFrames);
    if (count <= 0)
    {
        std::fprintf(stderr, "  [stack trace unavailable]\n");
        return;
    }
    // backtrace_symbols_fd does not allocate, so it is usable even when the heap is suspect.
    backtrace_symbols_fd(frames, count, STDERR_FILENO);
#else
    std::fprintf(stderr, "  [stack trace not supported on this platform]\n");
#endif
    std::fflush(stderr);
}

} // namespace nodebus::debug
