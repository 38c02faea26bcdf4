/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/scan_window.hpp"

#include <unity.h>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static resync::scan_window_t::result_t
feed_all (resync::scan_window_t &window_, const bytes_t &bytes_)
{
    resync::scan_window_t::result_t rc = resync::scan_window_t::need_more;
    for (size_t i = 0; i < bytes_.size (); ++i) {
        rc = window_.feed (bytes_[i]);
        if (rc != resync::scan_window_t::need_more) {
            TEST_ASSERT_EQUAL_UINT (bytes_.size () - 1, i);
        }
    }
    return rc;
}

void test_exact_frame ()
{
    resync::scan_window_t window (default_frame_size, default_marker, 2);

    const bytes_t frame = make_frame (0);
    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::frame_ready,
                           feed_all (window, frame));
    TEST_ASSERT_EQUAL_UINT (default_frame_size, window.size ());
    TEST_ASSERT_EQUAL_UINT (0, window.trimmed ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (&frame[0], window.frame (),
                                  default_frame_size);
}

void test_short_window ()
{
    resync::scan_window_t window (default_frame_size, default_marker, 2);

    const bytes_t frame = make_frame (0);
    const bytes_t tail (frame.begin () + 7, frame.end ());
    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::short_frame,
                           feed_all (window, tail));
    TEST_ASSERT_EQUAL_UINT (tail.size (), window.size ());
}

void test_marker_alone_is_short ()
{
    resync::scan_window_t window (default_frame_size, default_marker, 2);
    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::need_more,
                           window.feed (0x68));
    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::short_frame,
                           window.feed (0x69));
}

void test_long_window_trims_front ()
{
    resync::scan_window_t window (default_frame_size, default_marker, 2);

    bytes_t stream = make_garbage (13, 0);
    const bytes_t frame = make_frame (4);
    append (stream, frame);

    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::frame_ready,
                           feed_all (window, stream));
    TEST_ASSERT_EQUAL_UINT (13, window.trimmed ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (&frame[0], window.frame (),
                                  default_frame_size);
}

//  Garbage many times the frame size forces repeated compaction; the
//  frame still comes out intact.
void test_very_long_window ()
{
    resync::scan_window_t window (default_frame_size, default_marker, 2);

    bytes_t stream = make_garbage (10 * default_frame_size + 3, 1);
    const bytes_t frame = make_frame (9);
    append (stream, frame);

    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::frame_ready,
                           feed_all (window, stream));
    TEST_ASSERT_EQUAL_UINT (stream.size (), window.size ());
    TEST_ASSERT_EQUAL_UINT (10 * default_frame_size + 3, window.trimmed ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (&frame[0], window.frame (),
                                  default_frame_size);
}

//  A marker split across the compaction boundary is still recognized.
void test_marker_straddles_compaction ()
{
    for (size_t lead = 0; lead < 3 * default_frame_size; ++lead) {
        resync::scan_window_t window (default_frame_size, default_marker, 2);
        bytes_t stream = make_garbage (lead, 0);
        const bytes_t frame = make_frame (2);
        append (stream, frame);

        TEST_ASSERT_EQUAL_INT (resync::scan_window_t::frame_ready,
                               feed_all (window, stream));
        TEST_ASSERT_EQUAL_HEX8_ARRAY (&frame[0], window.frame (),
                                      default_frame_size);
    }
}

void test_reset_starts_new_cycle ()
{
    resync::scan_window_t window (default_frame_size, default_marker, 2);

    feed_all (window, make_garbage (5, 0));
    window.reset ();
    TEST_ASSERT_EQUAL_UINT (0, window.size ());

    //  Bytes seen before the reset do not count towards the frame.
    const bytes_t frame = make_frame (1);
    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::frame_ready,
                           feed_all (window, frame));
    TEST_ASSERT_EQUAL_UINT (0, window.trimmed ());
}

//  Payload that contains the marker ends the window early.
void test_false_positive_marker ()
{
    resync::scan_window_t window (default_frame_size, default_marker, 2);

    bytes_t payload = make_payload (default_payload_size, 0);
    payload[3] = 0x68;
    payload[4] = 0x69;
    const bytes_t frame = make_frame (payload);

    size_t i = 0;
    resync::scan_window_t::result_t rc = resync::scan_window_t::need_more;
    while (rc == resync::scan_window_t::need_more)
        rc = window.feed (frame[i++]);
    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::short_frame, rc);
    TEST_ASSERT_EQUAL_UINT (5, i);
}

void test_single_byte_marker_and_frame ()
{
    const unsigned char marker = 0x7E;
    resync::scan_window_t window (1, &marker, 1);

    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::need_more,
                           window.feed (0x01));
    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::frame_ready,
                           window.feed (0x7E));
    TEST_ASSERT_EQUAL_UINT (1, window.trimmed ());
    TEST_ASSERT_EQUAL_HEX8 (0x7E, window.frame ()[0]);
}

void test_overlapping_marker ()
{
    //  Marker "aab": the window "aaab" ends in it after the fourth byte.
    const unsigned char marker[] = {'a', 'a', 'b'};
    resync::scan_window_t window (4, marker, sizeof (marker));

    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::need_more, window.feed ('a'));
    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::need_more, window.feed ('a'));
    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::need_more, window.feed ('a'));
    TEST_ASSERT_EQUAL_INT (resync::scan_window_t::frame_ready,
                           window.feed ('b'));
    TEST_ASSERT_EQUAL_STRING_LEN ("aaab",
                                  reinterpret_cast<const char *> (window.frame ()),
                                  4);
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_exact_frame);
    RUN_TEST (test_short_window);
    RUN_TEST (test_marker_alone_is_short);
    RUN_TEST (test_long_window_trims_front);
    RUN_TEST (test_very_long_window);
    RUN_TEST (test_marker_straddles_compaction);
    RUN_TEST (test_reset_starts_new_cycle);
    RUN_TEST (test_false_positive_marker);
    RUN_TEST (test_single_byte_marker_and_frame);
    RUN_TEST (test_overlapping_marker);
    return UNITY_END ();
}
