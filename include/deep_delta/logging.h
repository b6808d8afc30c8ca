// logging.h - Diagnostic helpers for graceful-degradation paths
//
// The applier recovers locally from stale or forward-compatible documents
// (unknown op kinds, unknown members, DictNested on a missing key). Those
// events are reported here instead of being raised.
//
// To explicitly enable: #define DEEP_DELTA_VERBOSE_LOG 1
// To explicitly disable: #define DEEP_DELTA_VERBOSE_LOG 0

#pragma once

#include <deep_delta/deep_delta_config.h>

#include <iostream>
#include <source_location>
#include <string_view>

namespace deep_delta {

namespace detail {

inline void log_apply_warning(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEP_DELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_member_skip(
    std::string_view func,
    int member_index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEP_DELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] member " << member_index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)member_index;
    (void)reason;
    (void)loc;
#endif
}

inline void log_key_warning(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEP_DELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

} // namespace deep_delta
