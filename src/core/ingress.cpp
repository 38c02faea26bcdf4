/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/ingress.hpp"
#include "utils/err.hpp"

resync::ingress_t::ingress_t () : _size (0), _wanted (0), _wake_pending (false)
{
    //  Get the pipe into passive state so that the first read attempt
    //  does not find stale prefetched data.
    const bool ok = _pipe.check_read ();
    resync_assert (!ok);
}

resync::ingress_t::~ingress_t ()
{
    //  Work around problem that a producer might still be in our
    //  push() method, by waiting on the write lock before disappearing.
    _write_sync.lock ();
    _write_sync.unlock ();
}

void resync::ingress_t::push (const unsigned char *data_, size_t size_)
{
    if (size_ == 0)
        return;

    _write_sync.lock ();
    for (size_t i = 0; i + 1 < size_; ++i)
        _pipe.write (data_[i], true);
    _pipe.write (data_[size_ - 1], false);

    //  A false return only means the reader found the pipe empty last
    //  time it looked. Waking is driven by the threshold below instead.
    _pipe.flush ();
    _size.fetch_add (static_cast<int64_t> (size_));
    _write_sync.unlock ();

    const size_t wanted = _wanted.load ();
    if (wanted > 0 && size () >= wanted) {
        _sync.lock ();
        _cond_var.broadcast ();
        _sync.unlock ();
    }
}

bool resync::ingress_t::try_pop (unsigned char *byte_)
{
    if (!_pipe.read (byte_))
        return false;
    _size.fetch_sub (1);
    return true;
}

size_t resync::ingress_t::size () const
{
    //  The consumer may pop bytes before the producer has accounted for
    //  them, so the counter can dip below zero for a moment.
    const int64_t size = _size.load ();
    return size > 0 ? static_cast<size_t> (size) : 0;
}

bool resync::ingress_t::wait (size_t min_, int timeout_)
{
    scoped_lock_t lock (_sync);

    _wanted.store (min_);
    bool ready = size () >= min_;
    if (!ready && !_wake_pending) {
        const int rc = _cond_var.wait (&_sync, timeout_);
        if (rc == -1)
            errno_assert (errno == EAGAIN);
        ready = size () >= min_;
    }
    _wanted.store (0);
    _wake_pending = false;

    return ready;
}

void resync::ingress_t::wake ()
{
    scoped_lock_t lock (_sync);
    _wake_pending = true;
    _cond_var.broadcast ();
}

size_t resync::ingress_t::drain ()
{
    size_t count = 0;
    unsigned char byte;
    while (try_pop (&byte))
        ++count;
    return count;
}
