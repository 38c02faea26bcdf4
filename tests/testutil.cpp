/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include <unistd.h>

const unsigned char default_marker[2] = {0x68, 0x69};

bytes_t make_payload (size_t size_, unsigned char seed_)
{
    bytes_t payload (size_);
    for (size_t i = 0; i < size_; ++i)
        payload[i] = static_cast<unsigned char> ('A' + (seed_ + i) % 26);
    return payload;
}

bytes_t make_frame (const bytes_t &payload_,
                    const unsigned char *marker_,
                    size_t marker_size_)
{
    bytes_t frame (payload_);
    frame.insert (frame.end (), marker_, marker_ + marker_size_);
    return frame;
}

bytes_t make_frame (unsigned char seed_)
{
    return make_frame (make_payload (default_payload_size, seed_));
}

bytes_t make_garbage (size_t size_, unsigned char seed_)
{
    bytes_t garbage (size_);
    for (size_t i = 0; i < size_; ++i)
        garbage[i] = static_cast<unsigned char> ('0' + (seed_ + i) % 10);
    return garbage;
}

void append (bytes_t &to_, const bytes_t &from_)
{
    to_.insert (to_.end (), from_.begin (), from_.end ());
}

void msleep (int milliseconds_)
{
    usleep (static_cast<useconds_t> (milliseconds_) * 1000);
}

void setup_test_environment (int timeout_seconds_)
{
    //  abort test after timeout_seconds_, the default SIGALRM action
    //  terminates the process.
    alarm (timeout_seconds_);
}
