/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"

#include "utils/clock.hpp"
#include "utils/err.hpp"

#include <stdlib.h>
#include <unistd.h>

void resync_sleep (int seconds_)
{
    sleep (seconds_);
}

void *resync_stopwatch_start ()
{
    uint64_t *watch = static_cast<uint64_t *> (malloc (sizeof (uint64_t)));
    alloc_assert (watch);
    *watch = resync::clock_t::now_us ();
    return static_cast<void *> (watch);
}

unsigned long resync_stopwatch_intermediate (void *watch_)
{
    const uint64_t end = resync::clock_t::now_us ();
    const uint64_t start = *static_cast<uint64_t *> (watch_);
    return static_cast<unsigned long> (end - start);
}

unsigned long resync_stopwatch_stop (void *watch_)
{
    const unsigned long res = resync_stopwatch_intermediate (watch_);
    free (watch_);
    return res;
}
