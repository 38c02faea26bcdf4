/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/frame_handler.hpp"
#include "core/frame.hpp"
#include "utils/err.hpp"

resync::frame_handler_t::frame_handler_t (handler_fn *handler_, void *hint_) :
    _handler (handler_), _hint (hint_)
{
    resync_assert (_handler);
}

void resync::frame_handler_t::push_frame (frame_t *frame_)
{
    _handler (frame_->data (), frame_->size (), _hint);
    delete frame_;
}
