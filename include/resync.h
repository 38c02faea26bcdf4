/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_H_INCLUDED__
#define __RESYNC_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define RESYNC_VERSION_MAJOR 1
#define RESYNC_VERSION_MINOR 0
#define RESYNC_VERSION_PATCH 0

#define RESYNC_MAKE_VERSION(major, minor, patch)                               \
    ((major) *10000 + (minor) *100 + (patch))
#define RESYNC_VERSION                                                         \
    RESYNC_MAKE_VERSION (RESYNC_VERSION_MAJOR, RESYNC_VERSION_MINOR,           \
                         RESYNC_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

/*  Handle DSO symbol visibility                                             */
#if defined RESYNC_NO_EXPORT
#define RESYNC_EXPORT
#else
#if defined __GNUC__ && __GNUC__ >= 4
#define RESYNC_EXPORT __attribute__ ((visibility ("default")))
#else
#define RESYNC_EXPORT
#endif
#endif

/******************************************************************************/
/*  resync errors.                                                            */
/******************************************************************************/

/*  A number random enough not to collide with different errno ranges on      */
/*  different OSes. The assumption is that error_t is at least 32-bit type.   */
#define RESYNC_HAUSNUMERO 156384712

/*  On platforms lacking some POSIX error codes define them ourselves.        */
#ifndef ENOTSUP
#define ENOTSUP (RESYNC_HAUSNUMERO + 1)
#endif

/*  Native resync error codes.                                                */
#ifndef EFSM
#define EFSM (RESYNC_HAUSNUMERO + 51)
#endif
#ifndef ETERM
#define ETERM (RESYNC_HAUSNUMERO + 53)
#endif

/**
 * @brief Return the errno for the current thread.
 * @return errno value (POSIX errno or RESYNC_HAUSNUMERO-based code).
 */
RESYNC_EXPORT int resync_errno (void);

/**
 * @brief Return a human-readable string for the given error number.
 * @param errnum_  Error number (e.g. return value of resync_errno()).
 * @return Static string pointer. Must not be modified or freed.
 */
RESYNC_EXPORT const char *resync_strerror (int errnum_);

/**
 * @brief Return the runtime library version.
 * @param[out] major_  Major version.
 * @param[out] minor_  Minor version.
 * @param[out] patch_  Patch version.
 */
RESYNC_EXPORT void resync_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Session options.                                                          */
/******************************************************************************/

/*  Framing options; fixed once the session is started.                       */
#define RESYNC_FRAME_SIZE 1
#define RESYNC_MARKER 2
#define RESYNC_IDLE_IVL 3
#define RESYNC_SOURCE_HWM 5

/*  Consumer option; may be changed at any time.                              */
#define RESYNC_RCVTIMEO 4

/*  Read-only statistics (uint64_t unless noted).                             */
#define RESYNC_BUFFERED 20
#define RESYNC_FRAMES 21
#define RESYNC_SHORT_FRAMES 22
#define RESYNC_TRIMMED_BYTES 23
#define RESYNC_CONSUMED_BYTES 24
#define RESYNC_SOURCE_DROPPED 25
/*  int, errno of the last source failure or 0.                               */
#define RESYNC_SOURCE_ERROR 26

#define RESYNC_FRAME_SIZE_DFLT 22
#define RESYNC_IDLE_IVL_DFLT 100
#define RESYNC_MAX_FRAME_SIZE 65536
#define RESYNC_MAX_MARKER_SIZE 255

/*  Receive flags.                                                            */
#define RESYNC_DONTWAIT 1

/******************************************************************************/
/*  Session API.                                                              */
/******************************************************************************/

/**
 * @brief Frame delivery callback.
 *
 * Invoked on the framing thread once per frame. The data is only valid for
 * the duration of the call.
 */
typedef void (resync_frame_fn) (const void *data_, size_t size_, void *hint_);

/**
 * @brief Create a new session.
 *
 * The session owns the ingress buffer and, once started, the framing
 * thread. Must be released with resync_close().
 *
 * @return Session handle, or NULL on failure (errno is set).
 */
RESYNC_EXPORT void *resync_new (void);

/**
 * @brief Stop the session if needed and release all its resources.
 *
 * Must not be called from the session's own frame handler (EFSM); the
 * handler may call resync_stop() instead.
 * @param session_  Session handle.
 * @return 0 on success, -1 on failure (errno is set).
 */
RESYNC_EXPORT int resync_close (void *session_);

/**
 * @brief Set a session option.
 * @param session_    Session handle.
 * @param option_     Option name (RESYNC_FRAME_SIZE, RESYNC_MARKER, etc.).
 * @param optval_     Pointer to the option value.
 * @param optvallen_  Size of the option value in bytes.
 * @return 0 on success, -1 on failure (errno is set).
 */
RESYNC_EXPORT int resync_setopt (void *session_,
                                 int option_,
                                 const void *optval_,
                                 size_t optvallen_);

/**
 * @brief Get a session option or statistic.
 * @param session_         Session handle.
 * @param option_          Option name.
 * @param[out] optval_     Buffer receiving the value.
 * @param[in,out] optvallen_  In: buffer size. Out: value size.
 * @return 0 on success, -1 on failure (errno is set).
 */
RESYNC_EXPORT int resync_getopt (void *session_,
                                 int option_,
                                 void *optval_,
                                 size_t *optvallen_);

/**
 * @brief Deliver frames to a callback instead of resync_recv().
 *
 * Must be called before resync_start(). Passing NULL restores channel
 * delivery.
 */
RESYNC_EXPORT int
resync_set_handler (void *session_, resync_frame_fn *handler_, void *hint_);

/**
 * @brief Validate the options and start the framing thread.
 * @return 0 on success, -1 on failure (errno is set: EINVAL, EFSM).
 */
RESYNC_EXPORT int resync_start (void *session_);

/**
 * @brief Stop the byte source and the framing thread.
 *
 * Any partially scanned frame is discarded and the ingress buffer is
 * drained. Frames already delivered to the receive channel remain
 * available to resync_recv(). Calling it again is a no-op. When called
 * from the frame handler the framing thread exits after the handler
 * returns; no further frames are delivered.
 */
RESYNC_EXPORT int resync_stop (void *session_);

/**
 * @brief Append raw bytes to the session's ingress buffer.
 *
 * Safe to call from any thread, including a receive callback. Chunk
 * boundaries need not align with frame or marker boundaries.
 *
 * @return 0 on success, -1 on failure (ETERM once stopped).
 */
RESYNC_EXPORT int
resync_push (void *session_, const void *buf_, size_t len_);

/**
 * @brief Receive the next resynchronized frame.
 *
 * Copies at most @p len_ bytes of the frame into @p buf_.
 *
 * @param flags_  0 or RESYNC_DONTWAIT.
 * @return Frame size in bytes, or -1 on failure (EAGAIN, ETERM, ENOTSUP).
 */
RESYNC_EXPORT int
resync_recv (void *session_, void *buf_, size_t len_, int flags_);

/**
 * @brief Read the byte stream from an open descriptor.
 *
 * The session takes ownership of @p fd_ and closes it on stop. A
 * descriptor that is rejected (EFSM, or the descriptor cannot be
 * registered) is closed before the call returns.
 */
RESYNC_EXPORT int resync_attach_fd (void *session_, int fd_);

/**
 * @brief Open a serial device (8N1, no flow control) as the byte stream.
 * @param device_  Device path, e.g. "/dev/ttyUSB0".
 * @param baud_    Baud rate.
 */
RESYNC_EXPORT int
resync_attach_serial (void *session_, const char *device_, int baud_);

/******************************************************************************/
/*  Utilities.                                                                */
/******************************************************************************/

/** @brief Start a high-resolution stopwatch. Returns an opaque handle. */
RESYNC_EXPORT void *resync_stopwatch_start (void);

/** @brief Return elapsed microseconds without stopping the stopwatch. */
RESYNC_EXPORT unsigned long resync_stopwatch_intermediate (void *watch_);

/** @brief Stop the stopwatch and return total elapsed microseconds. */
RESYNC_EXPORT unsigned long resync_stopwatch_stop (void *watch_);

/** @brief Sleep for the given number of seconds. */
RESYNC_EXPORT void resync_sleep (int seconds_);

#ifdef __cplusplus
}
#endif

#endif
