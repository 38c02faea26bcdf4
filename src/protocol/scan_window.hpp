/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_SCAN_WINDOW_HPP_INCLUDED__
#define __RESYNC_SCAN_WINDOW_HPP_INCLUDED__

#include <stddef.h>
#include <vector>

#include "utils/macros.hpp"

namespace resync
{
//  Accumulates the bytes of one search cycle and recognizes the frame
//  that ends at the first marker occurrence.
//
//  The marker is compared after every single byte, so an occurrence is
//  never skipped. When the window ends in the marker:
//
//    - fewer than frame_size bytes were seen: the frame lost bytes
//      upstream; the whole window is to be discarded (short_frame),
//    - exactly frame_size bytes: the window is the frame,
//    - more bytes: leading garbage; the frame is the last frame_size
//      bytes and everything before it is dropped.
//
//  Only the trailing frame_size bytes can ever become part of a frame, so
//  older bytes are compacted away and the window occupies at most two
//  frames of memory however long the search takes.
//
//  Payload bytes that happen to equal the marker are indistinguishable
//  from a real boundary. Such a frame is reported short (or misaligned);
//  choosing a marker that is rare in payload data is the only remedy.

class scan_window_t
{
  public:
    enum result_t
    {
        need_more,
        short_frame,
        frame_ready
    };

    scan_window_t (size_t frame_size_,
                   const unsigned char *marker_,
                   size_t marker_size_);

    //  Appends one byte and checks whether the window now ends in the
    //  marker.
    result_t feed (unsigned char byte_);

    //  Starts a new search cycle with an empty window.
    void reset ();

    //  Bytes appended since the last reset.
    size_t size () const { return _count; }

    //  Pointer to the frame. Valid after feed () returned frame_ready,
    //  until the next feed () or reset ().
    const unsigned char *frame () const;

    //  Bytes in front of the frame dropped by the last frame_ready.
    size_t trimmed () const;

    size_t frame_size () const { return _frame_size; }

  private:
    const size_t _frame_size;
    const std::vector<unsigned char> _marker;

    //  Tail of the window; _len bytes are valid.
    std::vector<unsigned char> _buf;
    size_t _len;

    //  Logical length of the window including compacted bytes.
    size_t _count;

    RESYNC_NON_COPYABLE_NOR_MOVABLE (scan_window_t)
};
}

#endif
