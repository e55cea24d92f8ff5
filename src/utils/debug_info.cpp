/**
 * @file debug_info.cpp
 * @brief Cross-platform stack trace printing for fspec::debug::print_stack_trace().
 */
#include "fsp_base.hpp"

#if defined(FSPEC_PLATFORM_WIN64)

#include <dbghelp.h>

#elif defined(FSPEC_IS_POSIX)

#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace

#endif

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>

namespace fspec::debug
{

namespace
{
constexpr int kMaxFrames = 64;
// Skip print_stack_trace itself.
constexpr int kSkipFrames = 1;
} // namespace

#if defined(FSPEC_PLATFORM_WIN64)

void print_stack_trace() noexcept
{
    void *frames[kMaxFrames];
    const USHORT count = CaptureStackBackTrace(kSkipFrames, kMaxFrames, frames, nullptr);
    HANDLE process = GetCurrentProcess();
    SymSetOptions(SYMOPT_LOAD_LINES | SYMOPT_DEFERRED_LOADS | SYMOPT_UNDNAME);
    const bool have_symbols = SymInitialize(process, nullptr, TRUE) != FALSE;

    std::fprintf(stderr, "Stack Trace (most recent call first):\n");
    alignas(SYMBOL_INFO) char storage[sizeof(SYMBOL_INFO) + MAX_SYM_NAME];
    for (USHORT i = 0; i < count; ++i)
    {
        const auto addr = reinterpret_cast<DWORD64>(frames[i]);
        auto *symbol = reinterpret_cast<SYMBOL_INFO *>(storage);
        symbol->SizeOfStruct = sizeof(SYMBOL_INFO);
        symbol->MaxNameLen = MAX_SYM_NAME;
        DWORD64 displacement = 0;
        if (have_symbols && SymFromAddr(process, addr, &displacement, symbol))
        {
            std::fprintf(stderr, "  #%-2u %s + 0x%llx\n", static_cast<unsigned>(i), symbol->Name,
                         static_cast<unsigned long long>(displacement));
        }
        else
        {
            std::fprintf(stderr, "  #%-2u 0x%llx\n", static_cast<unsigned>(i),
                         static_cast<unsigned long long>(addr));
        }
    }
    if (have_symbols)
    {
        SymCleanup(process);
    }
    std::fflush(stderr);
}

#elif defined(FSPEC_IS_POSIX)

void print_stack_trace() noexcept
{
    void *frames[kMaxFrames];
    const int count = backtrace(frames, kMaxFrames);
    if (count <= 0)
    {
        std::fprintf(stderr, "Stack Trace: unavailable (backtrace returned %d)\n", count);
        return;
    }

    std::fprintf(stderr, "Stack Trace (most recent call first):\n");
    for (int i = kSkipFrames; i < count; ++i)
    {
        Dl_info info{};
        if (dladdr(frames[i], &info) == 0)
        {
            std::fprintf(stderr, "  #%-2d %p\n", i - kSkipFrames, frames[i]);
            continue;
        }

        const char *module = info.dli_fname ? format_tools::filename_only(info.dli_fname).data()
                                            : "??";
        if (info.dli_sname == nullptr)
        {
            std::fprintf(stderr, "  #%-2d %p in %s\n", i - kSkipFrames, frames[i], module);
            continue;
        }

        int status = 0;
        std::unique_ptr<char, decltype(&std::free)> demangled(
            abi::__cxa_demangle(info.dli_sname, nullptr, nullptr, &status), &std::free);
        const char *name = (status == 0 && demangled) ? demangled.get() : info.dli_sname;
        const auto offset = reinterpret_cast<std::uintptr_t>(frames[i]) -
                            reinterpret_cast<std::uintptr_t>(info.dli_saddr);
        std::fprintf(stderr, "  #%-2d %s + 0x%zx in %s\n", i - kSkipFrames, name,
                     static_cast<size_t>(offset), module);
    }
    std::fflush(stderr);
}

#else

void print_stack_trace() noexcept
{
    std::fprintf(stderr, "Stack Trace: not supported on this platform\n");
}

#endif

} // namespace fspec::debug
