/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_OPTIONS_HPP_INCLUDED__
#define __RESYNC_OPTIONS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace resync
{
struct options_t
{
    options_t ();

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Validates the relation between frame size and marker. Individual
    //  values are range-checked by setopt already.
    bool check () const;

    size_t payload_size () const
    {
        return static_cast<size_t> (frame_size) - marker.size ();
    }

    //  Total length of a frame including the trailing marker.
    int frame_size;

    //  Fixed byte sequence terminating every frame.
    std::vector<unsigned char> marker;

    //  Upper bound on a single idle wait of the framing loop, in ms.
    int idle_ivl;

    //  Timeout for receiving a frame, in ms. -1 waits forever.
    int rcvtimeo;

    //  Bytes the source may leave buffered before dropping reads.
    //  Zero means no limit.
    int source_hwm;
};

int do_getopt (void *optval_,
               size_t *optvallen_,
               const void *value_,
               size_t value_len_);

template <typename T>
int do_getopt (void *const optval_, size_t *const optvallen_, T value_)
{
    return do_getopt (optval_, optvallen_, &value_, sizeof (T));
}
}

#endif
