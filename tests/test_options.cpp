/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

SETUP_TEARDOWN_TESTSESSION

static int get_int_option (void *session_, int option_)
{
    int value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_SUCCESS_ERRNO (
      resync_getopt (session_, option_, &value, &size));
    TEST_ASSERT_EQUAL_UINT (sizeof (value), size);
    return value;
}

void test_defaults ()
{
    TEST_ASSERT_EQUAL_INT (RESYNC_FRAME_SIZE_DFLT,
                           get_int_option (test_session, RESYNC_FRAME_SIZE));
    TEST_ASSERT_EQUAL_INT (RESYNC_IDLE_IVL_DFLT,
                           get_int_option (test_session, RESYNC_IDLE_IVL));
    TEST_ASSERT_EQUAL_INT (0, get_int_option (test_session, RESYNC_SOURCE_HWM));

    unsigned char marker[RESYNC_MAX_MARKER_SIZE];
    size_t size = sizeof (marker);
    TEST_ASSERT_SUCCESS_ERRNO (
      resync_getopt (test_session, RESYNC_MARKER, marker, &size));
    TEST_ASSERT_EQUAL_UINT (2, size);
    TEST_ASSERT_EQUAL_HEX8 (0x68, marker[0]);
    TEST_ASSERT_EQUAL_HEX8 (0x69, marker[1]);

    TEST_ASSERT_EQUAL_UINT64 (0, get_stat (test_session, RESYNC_FRAMES));
    TEST_ASSERT_EQUAL_UINT64 (0, get_stat (test_session, RESYNC_BUFFERED));
    TEST_ASSERT_EQUAL_INT (0, get_int_option (test_session, RESYNC_SOURCE_ERROR));
}

void test_rcvtimeo_default_is_infinite ()
{
    void *s = resync_new ();
    TEST_ASSERT_NOT_NULL (s);
    TEST_ASSERT_EQUAL_INT (-1, get_int_option (s, RESYNC_RCVTIMEO));
    TEST_ASSERT_SUCCESS_ERRNO (resync_close (s));
}

void test_set_get_roundtrip ()
{
    set_int_option (test_session, RESYNC_FRAME_SIZE, 64);
    set_int_option (test_session, RESYNC_IDLE_IVL, 10);
    set_int_option (test_session, RESYNC_SOURCE_HWM, 4096);
    const unsigned char marker[] = {0xDE, 0xAD, 0xBE, 0xEF};
    TEST_ASSERT_SUCCESS_ERRNO (
      resync_setopt (test_session, RESYNC_MARKER, marker, sizeof (marker)));

    TEST_ASSERT_EQUAL_INT (64, get_int_option (test_session, RESYNC_FRAME_SIZE));
    TEST_ASSERT_EQUAL_INT (10, get_int_option (test_session, RESYNC_IDLE_IVL));
    TEST_ASSERT_EQUAL_INT (4096,
                           get_int_option (test_session, RESYNC_SOURCE_HWM));

    unsigned char out[8];
    size_t size = sizeof (out);
    TEST_ASSERT_SUCCESS_ERRNO (
      resync_getopt (test_session, RESYNC_MARKER, out, &size));
    TEST_ASSERT_EQUAL_UINT (sizeof (marker), size);
    TEST_ASSERT_EQUAL_HEX8_ARRAY (marker, out, sizeof (marker));
}

void test_invalid_values ()
{
    int value = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, resync_setopt (test_session, RESYNC_FRAME_SIZE, &value,
                             sizeof (value)));
    value = RESYNC_MAX_FRAME_SIZE + 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, resync_setopt (test_session, RESYNC_FRAME_SIZE, &value,
                             sizeof (value)));
    value = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      resync_setopt (test_session, RESYNC_IDLE_IVL, &value, sizeof (value)));
    value = -2;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      resync_setopt (test_session, RESYNC_RCVTIMEO, &value, sizeof (value)));
    value = -1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      resync_setopt (test_session, RESYNC_SOURCE_HWM, &value, sizeof (value)));

    //  Wrong option length.
    const short small = 22;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      resync_setopt (test_session, RESYNC_FRAME_SIZE, &small, sizeof (small)));

    //  Empty and oversized markers.
    const unsigned char marker[RESYNC_MAX_MARKER_SIZE + 1] = {0};
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, resync_setopt (test_session, RESYNC_MARKER, marker, 0));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      resync_setopt (test_session, RESYNC_MARKER, marker, sizeof (marker)));

    //  Unknown option and statistics are not settable.
    value = 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, resync_setopt (test_session, 999, &value, sizeof (value)));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      resync_setopt (test_session, RESYNC_FRAMES, &value, sizeof (value)));

    //  Failed calls leave the previous value in place.
    TEST_ASSERT_EQUAL_INT (RESYNC_FRAME_SIZE_DFLT,
                           get_int_option (test_session, RESYNC_FRAME_SIZE));
}

void test_getopt_buffer_too_small ()
{
    unsigned char marker[1];
    size_t size = sizeof (marker);
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, resync_getopt (test_session, RESYNC_MARKER, marker, &size));

    uint32_t narrow = 0;
    size = sizeof (narrow);
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, resync_getopt (test_session, RESYNC_FRAMES, &narrow, &size));
}

void test_marker_longer_than_frame_fails_at_start ()
{
    const unsigned char marker[] = {1, 2, 3, 4, 5};
    TEST_ASSERT_SUCCESS_ERRNO (
      resync_setopt (test_session, RESYNC_MARKER, marker, sizeof (marker)));
    set_int_option (test_session, RESYNC_FRAME_SIZE, 4);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, resync_start (test_session));

    //  Options can be fixed up in any order before starting.
    set_int_option (test_session, RESYNC_FRAME_SIZE, 5);
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));
}

void test_framing_options_fixed_after_start ()
{
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));

    int value = 30;
    TEST_ASSERT_FAILURE_ERRNO (
      EFSM, resync_setopt (test_session, RESYNC_FRAME_SIZE, &value,
                           sizeof (value)));
    TEST_ASSERT_FAILURE_ERRNO (
      EFSM, resync_setopt (test_session, RESYNC_MARKER, "ab", 2));
    TEST_ASSERT_FAILURE_ERRNO (
      EFSM,
      resync_setopt (test_session, RESYNC_IDLE_IVL, &value, sizeof (value)));
    TEST_ASSERT_FAILURE_ERRNO (
      EFSM,
      resync_setopt (test_session, RESYNC_SOURCE_HWM, &value, sizeof (value)));
    TEST_ASSERT_FAILURE_ERRNO (EFSM,
                               resync_set_handler (test_session, NULL, NULL));
    TEST_ASSERT_FAILURE_ERRNO (EFSM, resync_start (test_session));

    //  The receive timeout stays adjustable.
    set_int_option (test_session, RESYNC_RCVTIMEO, 0);
    TEST_ASSERT_EQUAL_INT (0, get_int_option (test_session, RESYNC_RCVTIMEO));
}

void test_start_after_stop_fails ()
{
    TEST_ASSERT_SUCCESS_ERRNO (resync_stop (test_session));
    TEST_ASSERT_FAILURE_ERRNO (EFSM, resync_start (test_session));
}

void test_bad_handle ()
{
    int value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, resync_close (NULL));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, resync_start (NULL));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, resync_stop (NULL));
    TEST_ASSERT_FAILURE_ERRNO (
      EFAULT, resync_setopt (NULL, RESYNC_FRAME_SIZE, &value, sizeof (value)));
    TEST_ASSERT_FAILURE_ERRNO (
      EFAULT, resync_getopt (NULL, RESYNC_FRAME_SIZE, &value, &size));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, resync_push (NULL, "x", 1));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, resync_recv (NULL, &value, 1, 0));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, resync_push (test_session, NULL, 1));
    TEST_ASSERT_FAILURE_ERRNO (
      EFAULT, resync_getopt (test_session, RESYNC_FRAME_SIZE, &value, NULL));
}

void test_strerror ()
{
    TEST_ASSERT_EQUAL_STRING ("Operation cannot be accomplished in current state",
                              resync_strerror (EFSM));
    TEST_ASSERT_EQUAL_STRING ("Session was stopped", resync_strerror (ETERM));

    int major, minor, patch;
    resync_version (&major, &minor, &patch);
    TEST_ASSERT_EQUAL_INT (RESYNC_VERSION_MAJOR, major);
    TEST_ASSERT_EQUAL_INT (RESYNC_VERSION_MINOR, minor);
    TEST_ASSERT_EQUAL_INT (RESYNC_VERSION_PATCH, patch);
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_defaults);
    RUN_TEST (test_rcvtimeo_default_is_infinite);
    RUN_TEST (test_set_get_roundtrip);
    RUN_TEST (test_invalid_values);
    RUN_TEST (test_getopt_buffer_too_small);
    RUN_TEST (test_marker_longer_than_frame_fails_at_start);
    RUN_TEST (test_framing_options_fixed_after_start);
    RUN_TEST (test_start_after_stop_fails);
    RUN_TEST (test_bad_handle);
    RUN_TEST (test_strerror);
    return UNITY_END ();
}
