#ifndef ULAROUTE_LOG_HPP_
#define ULAROUTE_LOG_HPP_

#include <string>
#include <functional>
#include <utility>
#include <cstdlib>
#include <fmt/format.h>

enum class log_level { debug, info, warning, error, critical };

extern bool g_verbose_logs;

using log_sink = std::function<void(log_level, const std::string &)>;
// Passing an empty function restores the default stdout/stderr sink.
void set_log_sink(log_sink sink);
void log_write(log_level lvl, const std::string &msg);

template <typename... Args>
void log_line(fmt::format_string<Args...> f, Args&&... args)
{
    log_write(log_level::info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warning(fmt::format_string<Args...> f, Args&&... args)
{
    log_write(log_level::warning, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args)
{
    log_write(log_level::error, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args)
{
    if (!g_verbose_logs)
        return;
    log_write(log_level::debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
[[noreturn]] void suicide(fmt::format_string<Args...> f, Args&&... args)
{
    log_write(log_level::critical, fmt::format(f, std::forward<Args>(args)...));
    std::exit(EXIT_FAILURE);
}

#endif

