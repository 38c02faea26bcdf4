/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_CONDITION_VARIABLE_HPP_INCLUDED__
#define __RESYNC_CONDITION_VARIABLE_HPP_INCLUDED__

#include "utils/err.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

#include <pthread.h>
#include <time.h>

namespace resync
{
//  Condition variable bound to a resync::mutex_t. Waits are measured on
//  CLOCK_MONOTONIC so wall clock adjustments do not stretch timeouts.

class condition_variable_t
{
  public:
    inline condition_variable_t ()
    {
        pthread_condattr_t attr;
        int rc = pthread_condattr_init (&attr);
        posix_assert (rc);
        rc = pthread_condattr_setclock (&attr, CLOCK_MONOTONIC);
        posix_assert (rc);
        rc = pthread_cond_init (&_cond, &attr);
        posix_assert (rc);
        rc = pthread_condattr_destroy (&attr);
        posix_assert (rc);
    }

    inline ~condition_variable_t ()
    {
        const int rc = pthread_cond_destroy (&_cond);
        posix_assert (rc);
    }

    //  Returns 0 when signaled, -1 with errno set to EAGAIN on timeout.
    //  A negative timeout waits forever. The mutex must be held.
    inline int wait (mutex_t *mutex_, int timeout_)
    {
        int rc;
        if (timeout_ >= 0) {
            struct timespec timeout;

            rc = clock_gettime (CLOCK_MONOTONIC, &timeout);
            errno_assert (rc == 0);

            timeout.tv_sec += timeout_ / 1000;
            timeout.tv_nsec += (timeout_ % 1000) * 1000000;

            if (timeout.tv_nsec >= 1000000000) {
                timeout.tv_sec++;
                timeout.tv_nsec -= 1000000000;
            }
            rc = pthread_cond_timedwait (&_cond, mutex_->get_mutex (),
                                         &timeout);
        } else
            rc = pthread_cond_wait (&_cond, mutex_->get_mutex ());

        if (rc == 0)
            return 0;

        if (rc == ETIMEDOUT) {
            errno = EAGAIN;
            return -1;
        }

        posix_assert (rc);
        return -1;
    }

    inline void broadcast ()
    {
        const int rc = pthread_cond_broadcast (&_cond);
        posix_assert (rc);
    }

  private:
    pthread_cond_t _cond;

    RESYNC_NON_COPYABLE_NOR_MOVABLE (condition_variable_t)
};
}

#endif
