/**
 * @file debug_info.cpp
 * @brief Stack trace printing for lgtv::debug::print_stack_trace().
 */
#include "lgtv_base.hpp"

#if defined(LGTV_IS_POSIX) && defined(__GLIBC__)
#include <execinfo.h>
#endif

namespace lgtv::debug
{

void print_stack_trace() noexcept
{
#if defined(LGTV_IS_POSIX) && defined(__GLIBC__)
    constexpr int kMaxFrames = 64;
    void *frames[kMaxFrames];
    const int count = ::backtrace(frames, kMaxFrames);
    fmt::print(stderr, "Stack trace ({} frames):\n", count);
    std::fflush(stderr);
    // Writes directly to the fd; no allocation in a possibly corrupted heap.
    ::backtrace_symbols_fd(frames, count, 2);
#else
    fmt::print(stderr, "Stack trace not available on this platform.\n");
#endif
}

} // namespace lgtv::debug
