#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace tbl::log
{

// Appends one line to <config-dir>/tbl.log. Returns false when the file
// cannot be opened; never throws.
bool append_log_line_to_file(std::string const &line) noexcept;

// If TBL_ENABLE_LOGGING is defined and non-zero, it takes precedence over
// TBL_BUILD_MINIMAL.
#if defined(TBL_ENABLE_LOGGING) && (TBL_ENABLE_LOGGING)
#define TBL_LOGGING_ACTIVE 1
#elif !defined(TBL_BUILD_MINIMAL)
#define TBL_LOGGING_ACTIVE 1
#else
#define TBL_LOGGING_ACTIVE 0
#endif

#if TBL_LOGGING_ACTIVE
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    const auto now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(level);
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    // The file copy survives the daemon losing its terminal.
    append_log_line_to_file(final);
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

// Operator-facing console output; not subject to TBL_BUILD_MINIMAL.
template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

template <typename... Args>
inline void print_error(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

} // namespace tbl::log

#if TBL_LOGGING_ACTIVE
#define TBL_LOG_INFO(fmt, ...) tbl::log::write_line('I', fmt, ##__VA_ARGS__)
#define TBL_LOG_DEBUG(fmt, ...) tbl::log::write_line('D', fmt, ##__VA_ARGS__)
#define TBL_LOG_WARN(fmt, ...) tbl::log::write_line('W', fmt, ##__VA_ARGS__)
#define TBL_LOG_ERROR(fmt, ...) tbl::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#define TBL_LOG_INFO(fmt, ...) (void)0
#define TBL_LOG_DEBUG(fmt, ...) (void)0
#define TBL_LOG_WARN(fmt, ...) (void)0
#define TBL_LOG_ERROR(fmt, ...) (void)0
#endif
