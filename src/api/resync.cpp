/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"

#include <new>

#include "core/session.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

void resync_version (int *major_, int *minor_, int *patch_)
{
    *major_ = RESYNC_VERSION_MAJOR;
    *minor_ = RESYNC_VERSION_MINOR;
    *patch_ = RESYNC_VERSION_PATCH;
}

const char *resync_strerror (int errnum_)
{
    return resync::errno_to_string (errnum_);
}

int resync_errno (void)
{
    return errno;
}

//  Session API

static resync::session_t *as_session (void *session_)
{
    resync::session_t *s = static_cast<resync::session_t *> (session_);
    if (!s || !s->check_tag ()) {
        errno = EFAULT;
        return NULL;
    }
    return s;
}

void *resync_new (void)
{
    resync::session_t *s = new (std::nothrow) resync::session_t;
    if (!s) {
        errno = ENOMEM;
        return NULL;
    }
    return s;
}

int resync_close (void *session_)
{
    resync::session_t *s = as_session (session_);
    if (!s)
        return -1;

    //  A handler cannot destroy the session it is running on.
    if (s->in_framing_thread ()) {
        errno = EFSM;
        return -1;
    }

    LIBRESYNC_DELETE (s);
    return 0;
}

int resync_setopt (void *session_,
                   int option_,
                   const void *optval_,
                   size_t optvallen_)
{
    resync::session_t *s = as_session (session_);
    if (!s)
        return -1;
    return s->setopt (option_, optval_, optvallen_);
}

int resync_getopt (void *session_,
                   int option_,
                   void *optval_,
                   size_t *optvallen_)
{
    resync::session_t *s = as_session (session_);
    if (!s)
        return -1;
    if (!optval_ || !optvallen_) {
        errno = EFAULT;
        return -1;
    }
    return s->getopt (option_, optval_, optvallen_);
}

int resync_set_handler (void *session_, resync_frame_fn *handler_, void *hint_)
{
    resync::session_t *s = as_session (session_);
    if (!s)
        return -1;
    return s->set_handler (handler_, hint_);
}

int resync_start (void *session_)
{
    resync::session_t *s = as_session (session_);
    if (!s)
        return -1;
    return s->start ();
}

int resync_stop (void *session_)
{
    resync::session_t *s = as_session (session_);
    if (!s)
        return -1;
    return s->stop ();
}

int resync_push (void *session_, const void *buf_, size_t len_)
{
    resync::session_t *s = as_session (session_);
    if (!s)
        return -1;
    if (!buf_ && len_ > 0) {
        errno = EFAULT;
        return -1;
    }
    return s->push (buf_, len_);
}

int resync_recv (void *session_, void *buf_, size_t len_, int flags_)
{
    resync::session_t *s = as_session (session_);
    if (!s)
        return -1;
    if (!buf_ && len_ > 0) {
        errno = EFAULT;
        return -1;
    }
    return s->recv (buf_, len_, flags_);
}

int resync_attach_fd (void *session_, int fd_)
{
    resync::session_t *s = as_session (session_);
    if (!s)
        return -1;
    if (fd_ < 0) {
        errno = EBADF;
        return -1;
    }
    return s->attach_fd (fd_);
}

int resync_attach_serial (void *session_, const char *device_, int baud_)
{
    resync::session_t *s = as_session (session_);
    if (!s)
        return -1;
    if (!device_) {
        errno = EFAULT;
        return -1;
    }
    return s->attach_serial (device_, baud_);
}
