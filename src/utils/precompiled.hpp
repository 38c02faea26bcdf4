/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_PRECOMPILED_HPP_INCLUDED__
#define __RESYNC_PRECOMPILED_HPP_INCLUDED__

#define __STDC_LIMIT_MACROS

// resync definitions and exported functions
#include "resync.h"

// standard C headers
#include <assert.h>
#include <errno.h>
#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// standard C++ headers
#include <algorithm>
#include <atomic>
#include <new>
#include <vector>

#endif
