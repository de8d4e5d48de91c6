#pragma once

#include <chrono>
#include <string_view>

// DIALOGCLEAN_PROFILING_LEVEL is set via CMake:
//   0 = Disabled (no profiling)
//   1 = Scope timers logged through plog

#ifndef DIALOGCLEAN_PROFILING_LEVEL
#define DIALOGCLEAN_PROFILING_LEVEL 0
#endif

#if DIALOGCLEAN_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

#if DIALOGCLEAN_PROFILING_LEVEL >= 1
// Shares the diagnostics log so stage timings sit next to stage traces.
constexpr int kProfilingLogInstance = 1;
#endif

namespace detail
{

#if DIALOGCLEAN_PROFILING_LEVEL >= 1
/**
 * @brief RAII scope timer for measuring and logging execution time
 *
 * Captures start time on construction and logs elapsed time on destruction.
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name) noexcept
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
        PLOG_DEBUG_(profiling::kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << duration.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

private:
    std::string_view name_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
};
#endif

} // namespace detail

} // namespace profiling

#if DIALOGCLEAN_PROFILING_LEVEL == 0
#define PROFILE_SCOPE() ((void)0)
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))

#else
#define PROFILE_SCOPE() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer __profiling_timer(nameExpr)

#endif
