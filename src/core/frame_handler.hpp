/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_FRAME_HANDLER_HPP_INCLUDED__
#define __RESYNC_FRAME_HANDLER_HPP_INCLUDED__

#include <stddef.h>

#include "core/i_frame_sink.hpp"
#include "utils/macros.hpp"

namespace resync
{
//  Sink that hands every frame to an application callback on the framing
//  thread and releases it afterwards.

class frame_handler_t RESYNC_FINAL : public i_frame_sink
{
  public:
    typedef void (handler_fn) (const void *data_, size_t size_, void *hint_);

    frame_handler_t (handler_fn *handler_, void *hint_);

    void push_frame (frame_t *frame_) RESYNC_OVERRIDE;

  private:
    handler_fn *const _handler;
    void *const _hint;

    RESYNC_NON_COPYABLE_NOR_MOVABLE (frame_handler_t)
};
}

#endif
