/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_CONFIG_HPP_INCLUDED__
#define __RESYNC_CONFIG_HPP_INCLUDED__

namespace resync
{
//  Compile-time settings.

enum
{
    //  Number of bytes stored in one chunk of the ingress pipe. Allocation
    //  happens once per chunk, so larger values mean fewer allocations on
    //  fast links and more slack memory on slow ones.
    ingress_granularity = 4096,

    //  Number of frames stored in one chunk of the frame queue.
    frame_pipe_granularity = 16,

    //  Size of the buffer a byte source reads into per read operation.
    source_read_size = 512
};
}

#endif
