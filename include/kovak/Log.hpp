#pragma once
// Logging macros routed into GLib's structured log under the "kovak" domain.
// Enable debug output with G_MESSAGES_DEBUG=kovak.

#include <glib.h>
#include <format>

#define KOVAK_LOG_DOMAIN "kovak"

#define KOVAK_DO_LOG(level, fmt, ...) \
    g_log(KOVAK_LOG_DOMAIN, level, "%s", std::format(fmt __VA_OPT__(,) __VA_ARGS__).c_str())

#define KOVAK_DEBUG(fmt, ...) KOVAK_DO_LOG(G_LOG_LEVEL_DEBUG, fmt __VA_OPT__(,) __VA_ARGS__)
#define KOVAK_LOG(fmt, ...)   KOVAK_DO_LOG(G_LOG_LEVEL_MESSAGE, fmt __VA_OPT__(,) __VA_ARGS__)
#define KOVAK_WARN(fmt, ...)  KOVAK_DO_LOG(G_LOG_LEVEL_WARNING, fmt __VA_OPT__(,) __VA_ARGS__)

// G_LOG_LEVEL_CRITICAL rather than G_LOG_LEVEL_ERROR: the latter aborts.
#define KOVAK_ERROR(fmt, ...) KOVAK_DO_LOG(G_LOG_LEVEL_CRITICAL, fmt __VA_OPT__(,) __VA_ARGS__)
