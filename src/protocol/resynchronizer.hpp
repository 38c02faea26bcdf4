/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_RESYNCHRONIZER_HPP_INCLUDED__
#define __RESYNC_RESYNCHRONIZER_HPP_INCLUDED__

#include <stdint.h>
#include <atomic>

#include "protocol/scan_window.hpp"
#include "utils/macros.hpp"

namespace resync
{
class frame_t;
class i_frame_sink;
class ingress_t;
struct options_t;

//  Turns the ingress byte stream into marker-terminated frames.
//
//  Each search cycle waits until the ingress holds at least one frame
//  worth of bytes, then pops bytes into a fresh scan window until it ends
//  in the marker. A short window is dropped for good (its bytes are not
//  re-examined); otherwise the last frame_size bytes are emitted. The
//  cycle then starts over.
//
//  The resynchronizer is the only consumer of the ingress. run () and
//  next_frame () must be called from a single thread; stop () and the
//  accessors may be called from anywhere.

class resynchronizer_t
{
  public:
    enum state_t
    {
        waiting_for_data,
        scanning,
        found,
        abandoned,
        stopped
    };

    resynchronizer_t (ingress_t &ingress_,
                      const options_t &options_,
                      i_frame_sink *sink_);
    ~resynchronizer_t ();

    //  Hands frames to the sink until stop () is called.
    void run ();

    //  Runs search cycles until one yields a frame. Returns 0 with the
    //  frame moved into frame_, or -1 with errno set to ETERM once
    //  stop () has been called. A partially scanned window is discarded.
    int next_frame (frame_t *frame_);

    //  Makes run () or next_frame () return between two byte steps.
    void stop ();

    state_t state () const;

    uint64_t frames () const { return _frames.load (); }
    uint64_t short_frames () const { return _short_frames.load (); }
    uint64_t trimmed_bytes () const { return _trimmed_bytes.load (); }
    uint64_t consumed_bytes () const { return _consumed_bytes.load (); }

  private:
    //  Blocks until the ingress holds min_ bytes. False when stopping.
    bool wait_for (size_t min_);

    int terminated ();

    bool stopping () const
    {
        return _stopping.load (std::memory_order_relaxed);
    }

    void set_state (state_t state_)
    {
        _state.store (state_, std::memory_order_relaxed);
    }

    ingress_t &_ingress;
    i_frame_sink *const _sink;
    scan_window_t _window;
    const int _idle_ivl;

    std::atomic<bool> _stopping;
    std::atomic<int> _state;

    std::atomic<uint64_t> _frames;
    std::atomic<uint64_t> _short_frames;
    std::atomic<uint64_t> _trimmed_bytes;
    std::atomic<uint64_t> _consumed_bytes;

    RESYNC_NON_COPYABLE_NOR_MOVABLE (resynchronizer_t)
};
}

#endif
