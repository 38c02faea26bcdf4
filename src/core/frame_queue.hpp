/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_FRAME_QUEUE_HPP_INCLUDED__
#define __RESYNC_FRAME_QUEUE_HPP_INCLUDED__

#include <stddef.h>

#include "core/i_frame_sink.hpp"
#include "core/ypipe.hpp"
#include "utils/clock.hpp"
#include "utils/condition_variable.hpp"
#include "utils/config.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

namespace resync
{
class frame_t;

//  Receive channel for frames. The framing thread pushes, any number of
//  application threads receive.

class frame_queue_t RESYNC_FINAL : public i_frame_sink
{
  public:
    frame_queue_t ();
    ~frame_queue_t () RESYNC_OVERRIDE;

    //  i_frame_sink implementation.
    void push_frame (frame_t *frame_) RESYNC_OVERRIDE;

    //  Moves the oldest frame into frame_. Timeout in milliseconds, 0 to
    //  poll, -1 to wait forever. Returns -1 with errno EAGAIN on timeout
    //  or ETERM once terminated and empty.
    int recv (frame_t *frame_, int timeout_);

    //  Wakes all receivers. Frames already queued can still be received.
    void terminate ();

  private:
    //  The pipe to store the frames.
    typedef ypipe_t<frame_t *, frame_pipe_granularity> fpipe_t;
    fpipe_t _fpipe;

    //  Condition variable to pass signals from writer thread to readers.
    condition_variable_t _cond_var;

    //  Synchronize access to the queue from receivers and the sender.
    mutex_t _sync;

    bool _terminated;

    clock_t _clock;

    RESYNC_NON_COPYABLE_NOR_MOVABLE (frame_queue_t)
};
}

#endif
