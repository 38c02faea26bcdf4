/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include <string.h>
#include <unistd.h>
#include <new>

#include "core/session.hpp"
#include "core/frame.hpp"
#include "protocol/resynchronizer.hpp"
#include "transports/serial/serial_source.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#define RESYNC_SESSION_TAG_VALUE_GOOD 0xbadcafe0
#define RESYNC_SESSION_TAG_VALUE_BAD 0xdeadbeef

resync::session_t::session_t () :
    _tag (RESYNC_SESSION_TAG_VALUE_GOOD),
    _handler_fn (NULL),
    _handler_hint (NULL),
    _started (false),
    _stopped (false)
{
}

bool resync::session_t::check_tag () const
{
    return _tag == RESYNC_SESSION_TAG_VALUE_GOOD;
}

resync::session_t::~session_t ()
{
    stop ();

    //  Joins a framing thread that was stopped from its own frame handler.
    _worker.stop ();

    //  Remove the tag, so that the object is considered dead.
    _tag = RESYNC_SESSION_TAG_VALUE_BAD;
}

int resync::session_t::setopt (int option_,
                               const void *optval_,
                               size_t optvallen_)
{
    scoped_lock_t lock (_sync);

    //  Only the receive timeout concerns the application side; everything
    //  else is baked into the framing thread and the source at start.
    if (option_ != RESYNC_RCVTIMEO && (_started || _stopped)) {
        errno = EFSM;
        return -1;
    }
    return _options.setopt (option_, optval_, optvallen_);
}

int resync::session_t::getopt (int option_, void *optval_, size_t *optvallen_)
{
    scoped_lock_t lock (_sync);

    const resynchronizer_t *r = _resynchronizer.get ();
    switch (option_) {
        case RESYNC_BUFFERED:
            return do_getopt<uint64_t> (optval_, optvallen_, _ingress.size ());

        case RESYNC_FRAMES:
            return do_getopt<uint64_t> (optval_, optvallen_,
                                        r ? r->frames () : 0);

        case RESYNC_SHORT_FRAMES:
            return do_getopt<uint64_t> (optval_, optvallen_,
                                        r ? r->short_frames () : 0);

        case RESYNC_TRIMMED_BYTES:
            return do_getopt<uint64_t> (optval_, optvallen_,
                                        r ? r->trimmed_bytes () : 0);

        case RESYNC_CONSUMED_BYTES:
            return do_getopt<uint64_t> (optval_, optvallen_,
                                        r ? r->consumed_bytes () : 0);

        case RESYNC_SOURCE_DROPPED:
            return do_getopt<uint64_t> (optval_, optvallen_,
                                        source_dropped ());

        case RESYNC_SOURCE_ERROR:
            return do_getopt<int> (optval_, optvallen_, source_error ());

        default:
            break;
    }
    return _options.getopt (option_, optval_, optvallen_);
}

int resync::session_t::set_handler (frame_handler_t::handler_fn *handler_,
                                    void *hint_)
{
    scoped_lock_t lock (_sync);
    if (_started || _stopped) {
        errno = EFSM;
        return -1;
    }
    _handler_fn = handler_;
    _handler_hint = hint_;
    return 0;
}

int resync::session_t::start ()
{
    scoped_lock_t lock (_sync);

    if (_started || _stopped) {
        errno = EFSM;
        return -1;
    }
    if (!_options.check ()) {
        errno = EINVAL;
        return -1;
    }

    i_frame_sink *sink = &_queue;
    if (_handler_fn) {
        _handler.reset (new (std::nothrow)
                          frame_handler_t (_handler_fn, _handler_hint));
        alloc_assert (_handler);
        sink = _handler.get ();
    }

    _resynchronizer.reset (new (std::nothrow)
                             resynchronizer_t (_ingress, _options, sink));
    alloc_assert (_resynchronizer);

    _worker.start (worker_routine, this, "resync");
    if (_source)
        _source->start (_options.source_hwm);

    _started = true;
    SESSION_DBG ("started: frame_size=%d, marker_size=%zu, handler=%d",
                 _options.frame_size, _options.marker.size (),
                 _handler_fn != NULL);
    return 0;
}

int resync::session_t::stop ()
{
    {
        scoped_lock_t lock (_sync);
        if (_stopped)
            return 0;
        _stopped = true;
    }

    //  From here on _source and _resynchronizer can no longer change.
    //  The lock is not held while joining so that a frame handler may
    //  still query the session.
    if (_source)
        _source->stop ();

    //  Called from the frame handler the framing thread cannot join
    //  itself; it exits once the handler returns and is joined on close.
    if (_resynchronizer) {
        _resynchronizer->stop ();
        if (!_worker.is_current_thread ())
            _worker.stop ();
    }

    const size_t drained = _ingress.drain ();
    if (drained > 0)
        SESSION_DBG ("stopped, %zu buffered bytes discarded", drained);

    _queue.terminate ();
    return 0;
}

int resync::session_t::push (const void *data_, size_t size_)
{
    if (_stopped.load ()) {
        errno = ETERM;
        return -1;
    }
    _ingress.push (static_cast<const unsigned char *> (data_), size_);
    return 0;
}

int resync::session_t::recv (void *buf_, size_t len_, int flags_)
{
    int timeout;
    {
        scoped_lock_t lock (_sync);
        if (_handler_fn) {
            errno = ENOTSUP;
            return -1;
        }
        timeout = (flags_ & RESYNC_DONTWAIT) ? 0 : _options.rcvtimeo;
    }

    frame_t frame;
    if (_queue.recv (&frame, timeout) == -1)
        return -1;

    //  At most len_ bytes are stored, the full size is reported.
    const size_t to_copy = frame.size () < len_ ? frame.size () : len_;
    if (to_copy > 0)
        memcpy (buf_, frame.data (), to_copy);
    return static_cast<int> (frame.size ());
}

int resync::session_t::attach_fd (int fd_)
{
    scoped_lock_t lock (_sync);
    if (_stopped || _source) {
        close_fd (fd_);
        errno = EFSM;
        return -1;
    }

    std::unique_ptr<serial_source_t> source (new (std::nothrow)
                                               serial_source_t (_ingress));
    alloc_assert (source);
    if (source->assign (fd_) == -1) {
        const int err = errno;
        close_fd (fd_);
        errno = err;
        return -1;
    }
    return attach_source (source);
}

bool resync::session_t::in_framing_thread () const
{
    return _worker.is_current_thread ();
}

int resync::session_t::attach_serial (const char *device_, int baud_)
{
    scoped_lock_t lock (_sync);
    if (_stopped || _source) {
        errno = EFSM;
        return -1;
    }
    if (baud_ <= 0) {
        errno = EINVAL;
        return -1;
    }

    std::unique_ptr<serial_source_t> source (new (std::nothrow)
                                               serial_source_t (_ingress));
    alloc_assert (source);
    if (source->open (device_, baud_) == -1)
        return -1;
    return attach_source (source);
}

void resync::session_t::close_fd (int fd_)
{
    const int rc = ::close (fd_);
    if (rc == -1)
        SESSION_DBG ("close of rejected descriptor %d failed: %s", fd_,
                     strerror (errno));
}

void resync::session_t::worker_routine (void *arg_)
{
    session_t *self = static_cast<session_t *> (arg_);
    self->_resynchronizer->run ();
}

int resync::session_t::attach_source (std::unique_ptr<serial_source_t> &source_)
{
    _source.swap (source_);
    if (_started)
        _source->start (_options.source_hwm);
    SESSION_DBG ("source attached, started=%d", _started ? 1 : 0);
    return 0;
}

uint64_t resync::session_t::source_dropped () const
{
    return _source ? _source->dropped_bytes () : 0;
}

int resync::session_t::source_error () const
{
    return _source ? _source->error () : 0;
}
