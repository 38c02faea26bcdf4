/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include <string.h>
#include <limits.h>

#include "core/options.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

static int opt_invalid ()
{
#if defined(RESYNC_ACT_MILITANT)
    resync_assert (false);
#endif
    errno = EINVAL;
    return -1;
}

int resync::do_getopt (void *const optval_,
                       size_t *const optvallen_,
                       const void *value_,
                       const size_t value_len_)
{
    if (*optvallen_ < value_len_) {
        return opt_invalid ();
    }
    memcpy (optval_, value_, value_len_);
    memset (static_cast<char *> (optval_) + value_len_, 0,
            *optvallen_ - value_len_);
    *optvallen_ = value_len_;
    return 0;
}

template <typename T>
static int do_setopt (const void *const optval_,
                      const size_t optvallen_,
                      T *const out_value_)
{
    if (optvallen_ == sizeof (T)) {
        memcpy (out_value_, optval_, sizeof (T));
        return 0;
    }
    return opt_invalid ();
}

static int do_setopt_int_in_range (const void *const optval_,
                                   const size_t optvallen_,
                                   const int min_,
                                   const int max_,
                                   int *const out_value_)
{
    int value = 0;
    if (do_setopt (optval_, optvallen_, &value) == -1)
        return -1;
    if (value < min_ || value > max_)
        return opt_invalid ();
    *out_value_ = value;
    return 0;
}

resync::options_t::options_t () :
    frame_size (RESYNC_FRAME_SIZE_DFLT),
    idle_ivl (RESYNC_IDLE_IVL_DFLT),
    rcvtimeo (-1),
    source_hwm (0)
{
    marker.push_back ('h');
    marker.push_back ('i');
}

int resync::options_t::setopt (int option_,
                               const void *optval_,
                               size_t optvallen_)
{
    switch (option_) {
        case RESYNC_FRAME_SIZE:
            return do_setopt_int_in_range (optval_, optvallen_, 1,
                                           RESYNC_MAX_FRAME_SIZE, &frame_size);

        case RESYNC_MARKER:
            if (optval_ == NULL || optvallen_ == 0
                || optvallen_ > RESYNC_MAX_MARKER_SIZE)
                return opt_invalid ();
            marker.assign (static_cast<const unsigned char *> (optval_),
                           static_cast<const unsigned char *> (optval_)
                             + optvallen_);
            return 0;

        case RESYNC_IDLE_IVL:
            return do_setopt_int_in_range (optval_, optvallen_, 1, INT_MAX,
                                           &idle_ivl);

        case RESYNC_RCVTIMEO:
            return do_setopt_int_in_range (optval_, optvallen_, -1, INT_MAX,
                                           &rcvtimeo);

        case RESYNC_SOURCE_HWM:
            return do_setopt_int_in_range (optval_, optvallen_, 0, INT_MAX,
                                           &source_hwm);

        default:
            break;
    }
    return opt_invalid ();
}

int resync::options_t::getopt (int option_,
                               void *optval_,
                               size_t *optvallen_) const
{
    switch (option_) {
        case RESYNC_FRAME_SIZE:
            return do_getopt (optval_, optvallen_, frame_size);

        case RESYNC_MARKER:
            return do_getopt (optval_, optvallen_, &marker[0], marker.size ());

        case RESYNC_IDLE_IVL:
            return do_getopt (optval_, optvallen_, idle_ivl);

        case RESYNC_RCVTIMEO:
            return do_getopt (optval_, optvallen_, rcvtimeo);

        case RESYNC_SOURCE_HWM:
            return do_getopt (optval_, optvallen_, source_hwm);

        default:
            break;
    }
    return opt_invalid ();
}

bool resync::options_t::check () const
{
    return !marker.empty () && frame_size > 0
           && marker.size () <= static_cast<size_t> (frame_size);
}
