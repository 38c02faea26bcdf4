/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/frame_queue.hpp"
#include "core/frame.hpp"
#include "utils/err.hpp"

resync::frame_queue_t::frame_queue_t () : _terminated (false)
{
}

resync::frame_queue_t::~frame_queue_t ()
{
    scoped_lock_t lock (_sync);
    frame_t *frame;
    while (_fpipe.read (&frame))
        delete frame;
}

void resync::frame_queue_t::push_frame (frame_t *frame_)
{
    scoped_lock_t lock (_sync);
    _fpipe.write (frame_, false);
    _fpipe.flush ();

    //  Any number of receivers may be parked on the condition variable.
    _cond_var.broadcast ();
}

int resync::frame_queue_t::recv (frame_t *frame_, int timeout_)
{
    scoped_lock_t lock (_sync);

    const uint64_t end = timeout_ > 0 ? _clock.now_ms () + timeout_ : 0;

    while (true) {
        //  Try to get the frame straight away.
        frame_t *frame;
        if (_fpipe.read (&frame)) {
            frame_->swap (*frame);
            delete frame;
            return 0;
        }

        if (_terminated) {
            errno = ETERM;
            return -1;
        }

        int wait_ms = timeout_;
        if (timeout_ > 0) {
            const uint64_t now = _clock.now_ms ();
            if (now >= end) {
                errno = EAGAIN;
                return -1;
            }
            wait_ms = static_cast<int> (end - now);
        } else if (timeout_ == 0) {
            errno = EAGAIN;
            return -1;
        }

        //  Wait for signal from the framing thread. Another receiver may
        //  already fetch the frame, so loop and look again either way.
        const int rc = _cond_var.wait (&_sync, wait_ms);
        if (rc == -1)
            errno_assert (errno == EAGAIN || errno == EINTR);
    }
}

void resync::frame_queue_t::terminate ()
{
    scoped_lock_t lock (_sync);
    _terminated = true;
    _cond_var.broadcast ();
}
