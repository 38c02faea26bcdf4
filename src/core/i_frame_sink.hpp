/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_I_FRAME_SINK_HPP_INCLUDED__
#define __RESYNC_I_FRAME_SINK_HPP_INCLUDED__

#include "utils/macros.hpp"

namespace resync
{
class frame_t;

//  Interface to be implemented by frame consumers.

class i_frame_sink
{
  public:
    virtual ~i_frame_sink () RESYNC_DEFAULT;

    //  Called from the framing thread once per frame, in stream order.
    //  The sink takes ownership of the frame.
    virtual void push_frame (frame_t *frame_) = 0;
};
}

#endif
