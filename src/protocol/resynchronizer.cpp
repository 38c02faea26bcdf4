/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/resynchronizer.hpp"
#include "core/frame.hpp"
#include "core/i_frame_sink.hpp"
#include "core/ingress.hpp"
#include "core/options.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

resync::resynchronizer_t::resynchronizer_t (ingress_t &ingress_,
                                            const options_t &options_,
                                            i_frame_sink *sink_) :
    _ingress (ingress_),
    _sink (sink_),
    _window (static_cast<size_t> (options_.frame_size),
             &options_.marker[0],
             options_.marker.size ()),
    _idle_ivl (options_.idle_ivl),
    _stopping (false),
    _state (waiting_for_data),
    _frames (0),
    _short_frames (0),
    _trimmed_bytes (0),
    _consumed_bytes (0)
{
}

resync::resynchronizer_t::~resynchronizer_t ()
{
}

void resync::resynchronizer_t::run ()
{
    resync_assert (_sink);

    frame_t frame;
    while (next_frame (&frame) == 0) {
        frame_t *out = new (std::nothrow) frame_t;
        alloc_assert (out);
        out->swap (frame);
        _sink->push_frame (out);
    }
    errno_assert (errno == ETERM);
}

int resync::resynchronizer_t::next_frame (frame_t *frame_)
{
    const size_t frame_size = _window.frame_size ();

    while (true) {
        set_state (waiting_for_data);
        if (!wait_for (frame_size))
            return terminated ();

        set_state (scanning);
        _window.reset ();

        while (true) {
            unsigned char byte;
            if (!_ingress.try_pop (&byte)) {
                if (!wait_for (1))
                    return terminated ();
                continue;
            }
            _consumed_bytes.fetch_add (1, std::memory_order_relaxed);

            const scan_window_t::result_t rc = _window.feed (byte);
            if (rc == scan_window_t::need_more) {
                if (unlikely (stopping ()))
                    return terminated ();
                continue;
            }

            if (rc == scan_window_t::short_frame) {
                set_state (abandoned);
                _short_frames.fetch_add (1, std::memory_order_relaxed);
                SCAN_DBG ("short window discarded: %zu of %zu bytes",
                          _window.size (), frame_size);
                break;
            }

            set_state (found);
            const size_t trimmed = _window.trimmed ();
            if (trimmed > 0) {
                _trimmed_bytes.fetch_add (trimmed, std::memory_order_relaxed);
                SCAN_DBG ("dropped %zu leading bytes", trimmed);
            }
            frame_->assign (_window.frame (), frame_size);
            _window.reset ();
            _frames.fetch_add (1, std::memory_order_relaxed);
            return 0;
        }
    }
}

void resync::resynchronizer_t::stop ()
{
    _stopping.store (true);
    _ingress.wake ();
}

resync::resynchronizer_t::state_t resync::resynchronizer_t::state () const
{
    return static_cast<state_t> (_state.load (std::memory_order_relaxed));
}

bool resync::resynchronizer_t::wait_for (size_t min_)
{
    while (!stopping ()) {
        if (_ingress.wait (min_, _idle_ivl))
            return true;
    }
    return false;
}

int resync::resynchronizer_t::terminated ()
{
    if (_window.size () > 0)
        SCAN_DBG ("stopping, %zu scanned bytes discarded", _window.size ());
    _window.reset ();
    set_state (stopped);
    errno = ETERM;
    return -1;
}
