/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_SESSION_HPP_INCLUDED__
#define __RESYNC_SESSION_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <memory>

#include "core/frame_handler.hpp"
#include "core/frame_queue.hpp"
#include "core/ingress.hpp"
#include "core/options.hpp"
#include "core/thread.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

namespace resync
{
class resynchronizer_t;
class serial_source_t;

//  Session is the object behind the C API handle. It owns the ingress,
//  the framing thread with its resynchronizer, the frame sink and an
//  optional byte source.

class session_t
{
  public:
    session_t ();
    ~session_t ();

    //  Returns false if object is not a session.
    bool check_tag () const;

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_);

    int set_handler (frame_handler_t::handler_fn *handler_, void *hint_);

    int start ();

    //  Idempotent. Stops the source first, then the framing thread.
    int stop ();

    int push (const void *data_, size_t size_);

    //  Returns the frame size, or -1 with errno set.
    int recv (void *buf_, size_t len_, int flags_);

    //  Takes ownership of fd_, closing it also when the attach fails.
    int attach_fd (int fd_);
    int attach_serial (const char *device_, int baud_);

    //  True when called from a frame handler of this session.
    bool in_framing_thread () const;

  private:
    static void worker_routine (void *arg_);

    int attach_source (std::unique_ptr<serial_source_t> &source_);
    void close_fd (int fd_);
    uint64_t source_dropped () const;
    int source_error () const;

    //  Used to check whether the object is a session.
    uint32_t _tag;

    options_t _options;

    ingress_t _ingress;

    //  Exactly one of the two sinks is used, chosen at start.
    frame_queue_t _queue;
    std::unique_ptr<frame_handler_t> _handler;
    frame_handler_t::handler_fn *_handler_fn;
    void *_handler_hint;

    std::unique_ptr<resynchronizer_t> _resynchronizer;
    thread_t _worker;

    std::unique_ptr<serial_source_t> _source;

    bool _started;
    std::atomic<bool> _stopped;

    //  Synchronizes state changes and option access.
    mutex_t _sync;

    RESYNC_NON_COPYABLE_NOR_MOVABLE (session_t)
};
}

#endif
