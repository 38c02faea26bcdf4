/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_DEBUG_HPP_INCLUDED__
#define __RESYNC_DEBUG_HPP_INCLUDED__

#include <cstdio>

//  Unified debug macros for resync components
//  Enable with -DRESYNC_DEBUG=1 during compilation
//
//  Usage:
//    SCAN_DBG ("short window discarded: %zu bytes", size);
//    SOURCE_DBG ("read completed: %zu bytes", bytes);
//    SESSION_DBG ("framing thread started");

#ifdef RESYNC_DEBUG

#define RESYNC_DBG(category, fmt, ...)                                         \
    do {                                                                       \
        fprintf (stderr, "[RESYNC:" category "] " fmt "\n", ##__VA_ARGS__);    \
    } while (0)

#define RESYNC_DBG_THIS(category, fmt, ...)                                    \
    do {                                                                       \
        fprintf (stderr, "[RESYNC:" category ":%p] " fmt "\n",                 \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define RESYNC_DBG(category, fmt, ...) ((void) 0)
#define RESYNC_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define SCAN_DBG(fmt, ...) RESYNC_DBG_THIS ("SCAN", fmt, ##__VA_ARGS__)
#define SOURCE_DBG(fmt, ...) RESYNC_DBG_THIS ("SOURCE", fmt, ##__VA_ARGS__)
#define SESSION_DBG(fmt, ...) RESYNC_DBG_THIS ("SESSION", fmt, ##__VA_ARGS__)

//  Severity-based macros (with this pointer)
#define RESYNC_LOG_ERROR(fmt, ...) RESYNC_DBG_THIS ("ERROR", fmt, ##__VA_ARGS__)
#define RESYNC_LOG_WARN(fmt, ...) RESYNC_DBG_THIS ("WARN", fmt, ##__VA_ARGS__)
#define RESYNC_LOG_INFO(fmt, ...) RESYNC_DBG_THIS ("INFO", fmt, ##__VA_ARGS__)

#endif
