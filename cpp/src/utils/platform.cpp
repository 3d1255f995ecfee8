/**
 * @file platform.cpp
 * @brief Process and thread identification.
 */
#include "lgtv_base.hpp"

#include <functional>
#include <thread>

#if defined(LGTV_PLATFORM_WIN64)
#include <windows.h>
#else
#include <pthread.h>
#include <unistd.h>
#endif

#if defined(LGTV_PLATFORM_LINUX)
#include <sys/syscall.h>
#endif

namespace lgtv::platform
{

uint64_t get_pid()
{
#if defined(LGTV_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(LGTV_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(LGTV_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(LGTV_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

} // namespace lgtv::platform
