/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_FRAME_HPP_INCLUDED__
#define __RESYNC_FRAME_HPP_INCLUDED__

#include <stddef.h>
#include <vector>

#include "utils/macros.hpp"

namespace resync
{
//  A complete, marker-terminated frame. Owns its bytes; once handed to a
//  sink nothing else refers to them.

class frame_t
{
  public:
    frame_t () {}

    frame_t (const unsigned char *data_, size_t size_) :
        _data (data_, data_ + size_)
    {
    }

    void assign (const unsigned char *data_, size_t size_)
    {
        _data.assign (data_, data_ + size_);
    }

    const unsigned char *data () const
    {
        return _data.empty () ? NULL : &_data[0];
    }

    size_t size () const { return _data.size (); }

    void swap (frame_t &other_) { _data.swap (other_._data); }

  private:
    std::vector<unsigned char> _data;

    RESYNC_NON_COPYABLE_NOR_MOVABLE (frame_t)
};
}

#endif
