/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_CLOCK_HPP_INCLUDED__
#define __RESYNC_CLOCK_HPP_INCLUDED__

#include "utils/macros.hpp"

#include <stdint.h>

namespace resync
{
class clock_t
{
  public:
    clock_t ();

    //  High precision timestamp.
    static uint64_t now_us ();

    //  Monotonic timestamp in milliseconds.
    uint64_t now_ms ();

  private:
    RESYNC_NON_COPYABLE_NOR_MOVABLE (clock_t)
};
}

#endif
