/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

SETUP_TEARDOWN_TESTSESSION

void test_timeo ()
{
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));

    //  Receive on an idle session returns immediately
    unsigned char buffer[32];
    TEST_ASSERT_FAILURE_ERRNO (
      EAGAIN, resync_recv (test_session, buffer, 32, RESYNC_DONTWAIT));

    //  Check whether receive timeout is honored
    const int timeout = 250;
    const int jitter = 50;
    set_int_option (test_session, RESYNC_RCVTIMEO, timeout);

    void *stopwatch = resync_stopwatch_start ();
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN,
                               resync_recv (test_session, buffer, 32, 0));
    unsigned int elapsed = resync_stopwatch_stop (stopwatch) / 1000;
    TEST_ASSERT_GREATER_THAN_INT (timeout - jitter, elapsed);
    if (elapsed >= timeout + jitter) {
        // we cannot assert this on a non-RT system
        fprintf (stderr,
                 "resync_recv took quite long, with a timeout of %i ms, it "
                 "took actually %i ms\n",
                 timeout, elapsed);
    }

    //  Check that normal frame flow works as expected
    push_bytes (test_session, make_frame (1));
    recv_frame_expect_success (test_session, make_frame (1));
}

void test_zero_timeout_polls ()
{
    set_int_option (test_session, RESYNC_RCVTIMEO, 0);
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));

    unsigned char buffer[32];
    TEST_ASSERT_FAILURE_ERRNO (
      EAGAIN, resync_recv (test_session, buffer, sizeof (buffer), 0));

    push_bytes (test_session, make_frame (3));

    //  Poll until the framing thread has delivered the frame.
    void *watch = resync_stopwatch_start ();
    int rc;
    while ((rc = resync_recv (test_session, buffer, sizeof (buffer),
                              RESYNC_DONTWAIT))
             == -1
           && errno == EAGAIN
           && resync_stopwatch_intermediate (watch) < RECV_TIMEOUT * 1000UL)
        msleep (5);
    resync_stopwatch_stop (watch);
    TEST_ASSERT_EQUAL_INT (static_cast<int> (default_frame_size), rc);
}

//  A frame larger than the buffer is truncated, the full size is returned.
void test_recv_truncates ()
{
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));
    const bytes_t frame = make_frame (5);
    push_bytes (test_session, frame);

    unsigned char buffer[8];
    memset (buffer, 0, sizeof (buffer));
    const int rc = TEST_ASSERT_SUCCESS_ERRNO (
      resync_recv (test_session, buffer, sizeof (buffer), 0));
    TEST_ASSERT_EQUAL_INT (static_cast<int> (default_frame_size), rc);
    TEST_ASSERT_EQUAL_HEX8_ARRAY (&frame[0], buffer, sizeof (buffer));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_timeo);
    RUN_TEST (test_zero_timeout_polls);
    RUN_TEST (test_recv_truncates);
    return UNITY_END ();
}
