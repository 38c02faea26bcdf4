/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

const char *resync::errno_to_string (int errno_)
{
    switch (errno_) {
        case EFSM:
            return "Operation cannot be accomplished in current state";
        case ETERM:
            return "Session was stopped";
#if ENOTSUP >= RESYNC_HAUSNUMERO
        case ENOTSUP:
            return "Not supported";
#endif
        default:
            return strerror (errno_);
    }
}

void resync::resync_abort (const char *errmsg_)
{
    LIBRESYNC_UNUSED (errmsg_);
    print_backtrace ();
    abort ();
}

#if defined __GLIBC__
#include <execinfo.h>

void resync::print_backtrace ()
{
    void *frames[64];
    const int depth = backtrace (frames, 64);
    backtrace_symbols_fd (frames, depth, fileno (stderr));
}
#else
void resync::print_backtrace ()
{
}
#endif
