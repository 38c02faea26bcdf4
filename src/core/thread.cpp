/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/thread.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

#include <signal.h>
#include <string.h>

extern "C" {
static void *thread_routine (void *arg_)
{
    //  Following code will guarantee more predictable latencies as it'll
    //  disallow any signal handling in the I/O thread.
    sigset_t signal_set;
    int rc = sigfillset (&signal_set);
    errno_assert (rc == 0);
    rc = pthread_sigmask (SIG_BLOCK, &signal_set, NULL);
    posix_assert (rc);

    resync::thread_t *self = static_cast<resync::thread_t *> (arg_);
    self->apply_name ();
    self->_tfn (self->_arg);
    return NULL;
}
}

void resync::thread_t::start (thread_fn *tfn_, void *arg_, const char *name_)
{
    _tfn = tfn_;
    _arg = arg_;
    if (name_) {
        strncpy (_name, name_, sizeof (_name) - 1);
        _name[sizeof (_name) - 1] = '\0';
    }
    const int rc = pthread_create (&_descriptor, NULL, thread_routine, this);
    posix_assert (rc);
    _started = true;
}

bool resync::thread_t::is_current_thread () const
{
    return _started && pthread_equal (pthread_self (), _descriptor) != 0;
}

void resync::thread_t::stop ()
{
    if (_started) {
        const int rc = pthread_join (_descriptor, NULL);
        posix_assert (rc);
        _started = false;
    }
}

void resync::thread_t::apply_name ()
{
    if (!_name[0])
        return;

#if defined __linux__ && defined __GLIBC__
    const int rc = pthread_setname_np (pthread_self (), _name);
    if (rc)
        return;
#endif
}
