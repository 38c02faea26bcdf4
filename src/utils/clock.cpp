/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/clock.hpp"
#include "utils/err.hpp"

#include <time.h>
#include <sys/time.h>

resync::clock_t::clock_t ()
{
}

uint64_t resync::clock_t::now_us ()
{
    struct timespec ts;
    const int rc = clock_gettime (CLOCK_MONOTONIC, &ts);
    //  Fallback to gettimeofday if the monotonic clock is unavailable.
    if (rc != 0) {
        struct timeval tv;
        const int rc2 = gettimeofday (&tv, NULL);
        errno_assert (rc2 == 0);
        return tv.tv_sec * static_cast<uint64_t> (1000000) + tv.tv_usec;
    }
    return ts.tv_sec * static_cast<uint64_t> (1000000) + ts.tv_nsec / 1000;
}

uint64_t resync::clock_t::now_ms ()
{
    return now_us () / 1000;
}
