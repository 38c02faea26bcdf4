/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/scan_window.hpp"
#include "utils/err.hpp"

#include <string.h>

resync::scan_window_t::scan_window_t (size_t frame_size_,
                                      const unsigned char *marker_,
                                      size_t marker_size_) :
    _frame_size (frame_size_),
    _marker (marker_, marker_ + marker_size_),
    _buf (2 * frame_size_),
    _len (0),
    _count (0)
{
    resync_assert (marker_size_ > 0);
    resync_assert (marker_size_ <= frame_size_);
}

resync::scan_window_t::result_t resync::scan_window_t::feed (unsigned char byte_)
{
    if (unlikely (_len == _buf.size ())) {
        //  Keep the bytes that may still become part of a frame.
        const size_t keep = _frame_size - 1;
        memmove (&_buf[0], &_buf[0] + _len - keep, keep);
        _len = keep;
    }
    _buf[_len++] = byte_;
    _count++;

    const size_t marker_size = _marker.size ();
    if (_count < marker_size)
        return need_more;
    if (memcmp (&_buf[0] + _len - marker_size, &_marker[0], marker_size) != 0)
        return need_more;

    if (_count < _frame_size)
        return short_frame;
    return frame_ready;
}

void resync::scan_window_t::reset ()
{
    _len = 0;
    _count = 0;
}

const unsigned char *resync::scan_window_t::frame () const
{
    resync_assert (_count >= _frame_size);
    return &_buf[0] + _len - _frame_size;
}

size_t resync::scan_window_t::trimmed () const
{
    return _count >= _frame_size ? _count - _frame_size : 0;
}
