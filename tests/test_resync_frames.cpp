/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

SETUP_TEARDOWN_TESTSESSION

//  A receiver joining k bytes into the stream recovers every frame that
//  follows.
void test_resync_from_every_offset ()
{
    const int frame_count = 4;

    for (size_t k = 0; k < default_frame_size; ++k) {
        void *s = resync_new ();
        TEST_ASSERT_NOT_NULL (s);
        set_int_option (s, RESYNC_RCVTIMEO, RECV_TIMEOUT);
        TEST_ASSERT_SUCCESS_ERRNO (resync_start (s));

        bytes_t stream = make_garbage (k, static_cast<unsigned char> (k));
        for (int i = 0; i < frame_count; ++i)
            append (stream, make_frame (static_cast<unsigned char> (i)));
        push_bytes (s, stream);

        for (int i = 0; i < frame_count; ++i)
            recv_frame_expect_success (s,
                                       make_frame (static_cast<unsigned char> (i)));
        recv_frame_expect_none (s, 50);

        TEST_ASSERT_EQUAL_UINT64 (k, get_stat (s, RESYNC_TRIMMED_BYTES));
        TEST_ASSERT_EQUAL_UINT64 (0, get_stat (s, RESYNC_SHORT_FRAMES));
        TEST_ASSERT_SUCCESS_ERRNO (resync_close (s));
    }
}

//  Losing up to PAYLOAD_SIZE - 1 leading bytes of a frame costs that frame
//  only.
void test_loss_of_leading_payload_bytes ()
{
    for (size_t lost = 1; lost < default_payload_size; ++lost) {
        void *s = resync_new ();
        TEST_ASSERT_NOT_NULL (s);
        set_int_option (s, RESYNC_RCVTIMEO, RECV_TIMEOUT);
        TEST_ASSERT_SUCCESS_ERRNO (resync_start (s));

        const bytes_t damaged = make_frame (1);
        bytes_t stream (damaged.begin () + lost, damaged.end ());
        append (stream, make_frame (2));
        push_bytes (s, stream);

        recv_frame_expect_success (s, make_frame (2));
        recv_frame_expect_none (s, 50);
        TEST_ASSERT_EQUAL_UINT64 (1, get_stat (s, RESYNC_SHORT_FRAMES));
        TEST_ASSERT_EQUAL_UINT64 (1, get_stat (s, RESYNC_FRAMES));
        TEST_ASSERT_SUCCESS_ERRNO (resync_close (s));
    }
}

void test_garbage_is_trimmed_from_the_front ()
{
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));

    //  Longer than a whole frame.
    bytes_t stream = make_garbage (57, 3);
    append (stream, make_frame (7));
    push_bytes (test_session, stream);

    recv_frame_expect_success (test_session, make_frame (7));
    TEST_ASSERT_EQUAL_UINT64 (57, get_stat (test_session, RESYNC_TRIMMED_BYTES));
    TEST_ASSERT_EQUAL_UINT64 (57 + default_frame_size,
                              get_stat (test_session, RESYNC_CONSUMED_BYTES));
}

void test_order_preserved_across_arbitrary_chunks ()
{
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));

    const int frame_count = 30;
    bytes_t stream;
    for (int i = 0; i < frame_count; ++i)
        append (stream, make_frame (static_cast<unsigned char> (i)));

    //  Irregular chunk sizes, single bytes included.
    const size_t chunks[] = {1, 7, 1, 1, 22, 3, 45, 1, 13, 64};
    size_t offset = 0;
    for (size_t i = 0; offset < stream.size (); ++i) {
        size_t n = chunks[i % (sizeof (chunks) / sizeof (chunks[0]))];
        if (n > stream.size () - offset)
            n = stream.size () - offset;
        TEST_ASSERT_SUCCESS_ERRNO (
          resync_push (test_session, &stream[offset], n));
        offset += n;
    }

    for (int i = 0; i < frame_count; ++i)
        recv_frame_expect_success (test_session,
                                   make_frame (static_cast<unsigned char> (i)));
    TEST_ASSERT_EQUAL_UINT64 (0, get_stat (test_session, RESYNC_TRIMMED_BYTES));
}

void test_single_byte_pushes_match_one_push ()
{
    bytes_t frame (default_payload_size, 0x00);
    frame.push_back (0x68);
    frame.push_back (0x69);

    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));
    push_bytes (test_session, frame);
    recv_frame_expect_success (test_session, frame);

    push_in_chunks (test_session, frame, 1);
    recv_frame_expect_success (test_session, frame);

    TEST_ASSERT_EQUAL_UINT64 (2, get_stat (test_session, RESYNC_FRAMES));
}

void test_garbage_then_two_frames ()
{
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));

    const unsigned char garbage[] = {0x01, 0x02, 0x03, 0x04, 0x05};
    TEST_ASSERT_SUCCESS_ERRNO (
      resync_push (test_session, garbage, sizeof (garbage)));
    push_bytes (test_session, make_frame (1));
    push_bytes (test_session, make_frame (2));

    recv_frame_expect_success (test_session, make_frame (1));
    recv_frame_expect_success (test_session, make_frame (2));
    recv_frame_expect_none (test_session, 50);
}

void test_frame_missing_three_payload_bytes ()
{
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));

    const bytes_t damaged = make_frame (1);
    push_bytes (test_session, bytes_t (damaged.begin () + 3, damaged.end ()));
    push_bytes (test_session, make_frame (2));

    recv_frame_expect_success (test_session, make_frame (2));
    recv_frame_expect_none (test_session, 50);
    TEST_ASSERT_EQUAL_UINT64 (1, get_stat (test_session, RESYNC_SHORT_FRAMES));
}

void test_bytes_pushed_before_start_are_framed ()
{
    push_bytes (test_session, make_frame (4));
    TEST_ASSERT_EQUAL_UINT64 (default_frame_size,
                              get_stat (test_session, RESYNC_BUFFERED));

    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));
    recv_frame_expect_success (test_session, make_frame (4));
    TEST_ASSERT_EQUAL_UINT64 (0, get_stat (test_session, RESYNC_BUFFERED));
}

void test_custom_geometry ()
{
    const unsigned char marker[] = {0xAA, 0x55, 0xAA};
    set_int_option (test_session, RESYNC_FRAME_SIZE, 8);
    TEST_ASSERT_SUCCESS_ERRNO (
      resync_setopt (test_session, RESYNC_MARKER, marker, sizeof (marker)));
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));

    const bytes_t frame = make_frame (make_payload (5, 0), marker, 3);
    bytes_t stream = make_garbage (11, 0);
    append (stream, frame);
    append (stream, frame);
    push_in_chunks (test_session, stream, 3);

    recv_frame_expect_success (test_session, frame);
    recv_frame_expect_success (test_session, frame);
}

void test_marker_only_frames ()
{
    //  A frame consisting of the marker alone has an empty payload.
    set_int_option (test_session, RESYNC_FRAME_SIZE, 2);
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));

    bytes_t stream = make_garbage (3, 0);
    append (stream, make_frame (bytes_t ()));
    append (stream, make_frame (bytes_t ()));
    push_bytes (test_session, stream);

    recv_frame_expect_success (test_session, make_frame (bytes_t ()));
    recv_frame_expect_success (test_session, make_frame (bytes_t ()));
}

//  Payload bytes equal to the marker end the window early: both halves of
//  the frame end in a marker and are dropped as short windows.
void test_marker_inside_payload_is_not_detected ()
{
    TEST_ASSERT_SUCCESS_ERRNO (resync_start (test_session));

    bytes_t payload = make_payload (default_payload_size, 0);
    payload[5] = 0x68;
    payload[6] = 0x69;
    bytes_t stream = make_frame (payload);
    append (stream, make_frame (9));
    append (stream, make_frame (10));
    push_bytes (test_session, stream);

    recv_frame_expect_success (test_session, make_frame (9));
    recv_frame_expect_success (test_session, make_frame (10));
    TEST_ASSERT_EQUAL_UINT64 (2, get_stat (test_session, RESYNC_SHORT_FRAMES));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_resync_from_every_offset);
    RUN_TEST (test_loss_of_leading_payload_bytes);
    RUN_TEST (test_garbage_is_trimmed_from_the_front);
    RUN_TEST (test_order_preserved_across_arbitrary_chunks);
    RUN_TEST (test_single_byte_pushes_match_one_push);
    RUN_TEST (test_garbage_then_two_frames);
    RUN_TEST (test_frame_missing_three_payload_bytes);
    RUN_TEST (test_bytes_pushed_before_start_are_framed);
    RUN_TEST (test_custom_geometry);
    RUN_TEST (test_marker_only_frames);
    RUN_TEST (test_marker_inside_payload_is_not_detected);
    return UNITY_END ();
}
