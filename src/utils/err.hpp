/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_ERR_HPP_INCLUDED__
#define __RESYNC_ERR_HPP_INCLUDED__

#include <assert.h>
#include <errno.h>
#include <string.h>
#include <stdlib.h>
#include <stdio.h>

#include "utils/likely.hpp"

//  resync-specific error codes are defined in resync.h

namespace resync
{
const char *errno_to_string (int errno_);
#if defined __clang__
#if __has_feature(attribute_analyzer_noreturn)
void resync_abort (const char *errmsg_) __attribute__ ((analyzer_noreturn));
#else
void resync_abort (const char *errmsg_);
#endif
#else
void resync_abort (const char *errmsg_);
#endif
void print_backtrace ();
}

//  This macro works in exactly the same way as the normal assert. It is used
//  in its stead because it stays active in release builds.
#define resync_assert(x)                                                       \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            fprintf (stderr, "Assertion failed: %s (%s:%d)\n", #x, __FILE__,   \
                     __LINE__);                                                \
            fflush (stderr);                                                   \
            resync::resync_abort (#x);                                         \
        }                                                                      \
    } while (false)

//  Provides convenient way to check for errno-style errors.
#define errno_assert(x)                                                        \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            const char *errstr = strerror (errno);                             \
            fprintf (stderr, "%s (%s:%d)\n", errstr, __FILE__, __LINE__);      \
            fflush (stderr);                                                   \
            resync::resync_abort (errstr);                                     \
        }                                                                      \
    } while (false)

//  Provides convenient way to check for POSIX errors.
#define posix_assert(x)                                                        \
    do {                                                                       \
        if (unlikely (x)) {                                                    \
            const char *errstr = strerror (x);                                 \
            fprintf (stderr, "%s (%s:%d)\n", errstr, __FILE__, __LINE__);      \
            fflush (stderr);                                                   \
            resync::resync_abort (errstr);                                     \
        }                                                                      \
    } while (false)

//  Provides convenient way to check whether memory allocation have succeeded.
#define alloc_assert(x)                                                        \
    do {                                                                       \
        if (unlikely (!(x))) {                                                 \
            fprintf (stderr, "FATAL ERROR: OUT OF MEMORY (%s:%d)\n", __FILE__, \
                     __LINE__);                                                \
            fflush (stderr);                                                   \
            resync::resync_abort ("FATAL ERROR: OUT OF MEMORY");               \
        }                                                                      \
    } while (false)

#endif
