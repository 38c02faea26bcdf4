/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_INGRESS_HPP_INCLUDED__
#define __RESYNC_INGRESS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <atomic>

#include "core/ypipe.hpp"
#include "utils/config.hpp"
#include "utils/condition_variable.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

namespace resync
{
//  Unbounded byte FIFO between the byte source and the framing loop.
//
//  The bytes travel through a lock-free single producer, single consumer
//  pipe. Producers additionally serialize on a short write lock so that
//  more than one source thread may push safely; the consumer side never
//  takes that lock. The consumer may block in wait () until enough bytes
//  are buffered; producers only touch the condition variable when such a
//  waiter's threshold has been reached.

class ingress_t
{
  public:
    ingress_t ();
    ~ingress_t ();

    //  Producer side. Appends size_ bytes preserving their order.
    void push (const unsigned char *data_, size_t size_);

    //  Consumer side. Removes the oldest byte, returns false if empty.
    bool try_pop (unsigned char *byte_);

    //  Number of buffered bytes. Advisory while producers are active.
    size_t size () const;

    //  Consumer side. Blocks until at least min_ bytes are buffered, the
    //  timeout (in milliseconds, -1 for infinite) expires or wake () is
    //  called. Returns true if the threshold was reached.
    bool wait (size_t min_, int timeout_);

    //  Interrupts a pending or the next wait ().
    void wake ();

    //  Consumer side. Discards all buffered bytes, returns their count.
    size_t drain ();

  private:
    typedef ypipe_t<unsigned char, ingress_granularity> pipe_t;
    pipe_t _pipe;

    //  Serializes producers.
    mutex_t _write_sync;

    //  Bytes written but not yet popped.
    std::atomic<int64_t> _size;

    //  Threshold the consumer waits for, zero when nobody waits.
    std::atomic<size_t> _wanted;

    mutex_t _sync;
    condition_variable_t _cond_var;
    bool _wake_pending;

    RESYNC_NON_COPYABLE_NOR_MOVABLE (ingress_t)
};
}

#endif
