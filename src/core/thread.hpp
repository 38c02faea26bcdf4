/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_THREAD_HPP_INCLUDED__
#define __RESYNC_THREAD_HPP_INCLUDED__

#include <pthread.h>

#include "utils/macros.hpp"

namespace resync
{
typedef void (thread_fn) (void *);

//  Class encapsulating OS thread. Thread initiation/termination is done
//  using special functions rather than in constructor/destructor so that
//  thread isn't created during object construction by accident, causing
//  newly created thread to access half-initialised object. Same applies
//  to the destruction process: Thread should be terminated before object
//  destruction begins, otherwise it can access half-destructed object.

class thread_t
{
  public:
    thread_t () : _tfn (NULL), _arg (NULL), _started (false)
    {
        _name[0] = '\0';
    }

    //  Creates OS thread. 'tfn' is main thread function. It'll be passed
    //  'arg' as an argument. Name is copied, at most 15 characters are
    //  used.
    void start (thread_fn *tfn_, void *arg_, const char *name_);

    //  Returns whether the thread was started, i.e. start was called.
    bool get_started () const { return _started; }

    //  Returns whether the executing thread is the thread represented
    //  by the thread object.
    bool is_current_thread () const;

    //  Waits for thread termination.
    void stop ();

    //  These are internal members. They should be private, however then
    //  they would not be accessible from the main C routine of the thread.
    void apply_name ();
    thread_fn *_tfn;
    void *_arg;
    char _name[16];

  private:
    bool _started;
    pthread_t _descriptor;

    RESYNC_NON_COPYABLE_NOR_MOVABLE (thread_t)
};
}

#endif
