/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/frame.hpp"
#include "core/i_frame_sink.hpp"
#include "core/ingress.hpp"
#include "core/options.hpp"
#include "core/thread.hpp"
#include "protocol/resynchronizer.hpp"
#include "utils/mutex.hpp"

#include <unity.h>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

//  Collects frames pushed by the framing thread.
class test_sink_t : public resync::i_frame_sink
{
  public:
    void push_frame (resync::frame_t *frame_)
    {
        resync::scoped_lock_t lock (_sync);
        _frames.push_back (bytes_t (frame_->data (),
                                    frame_->data () + frame_->size ()));
        delete frame_;
    }

    size_t count ()
    {
        resync::scoped_lock_t lock (_sync);
        return _frames.size ();
    }

    bytes_t at (size_t i_)
    {
        resync::scoped_lock_t lock (_sync);
        return _frames[i_];
    }

  private:
    resync::mutex_t _sync;
    std::vector<bytes_t> _frames;
};

static void run_routine (void *arg_)
{
    static_cast<resync::resynchronizer_t *> (arg_)->run ();
}

static void push (resync::ingress_t &ingress_, const bytes_t &bytes_)
{
    ingress_.push (&bytes_[0], bytes_.size ());
}

static void next_frame_expect (resync::resynchronizer_t &r_,
                               const bytes_t &expected_)
{
    resync::frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, r_.next_frame (&frame));
    TEST_ASSERT_EQUAL_UINT (expected_.size (), frame.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (&expected_[0], frame.data (),
                                  expected_.size ());
}

void test_next_frame_cycles ()
{
    resync::ingress_t ingress;
    resync::options_t options;
    resync::resynchronizer_t r (ingress, options, NULL);
    TEST_ASSERT_EQUAL_INT (resync::resynchronizer_t::waiting_for_data,
                           r.state ());

    bytes_t stream = make_garbage (6, 0);
    append (stream, make_frame (1));
    const bytes_t damaged = make_frame (2);
    stream.insert (stream.end (), damaged.begin () + 4, damaged.end ());
    append (stream, make_frame (3));
    push (ingress, stream);

    next_frame_expect (r, make_frame (1));
    TEST_ASSERT_EQUAL_INT (resync::resynchronizer_t::found, r.state ());
    TEST_ASSERT_EQUAL_UINT64 (6, r.trimmed_bytes ());

    next_frame_expect (r, make_frame (3));
    TEST_ASSERT_EQUAL_UINT64 (2, r.frames ());
    TEST_ASSERT_EQUAL_UINT64 (1, r.short_frames ());
    TEST_ASSERT_EQUAL_UINT64 (stream.size (), r.consumed_bytes ());
    TEST_ASSERT_EQUAL_UINT (0, ingress.size ());
}

//  After a short window the next cycle again waits for a full frame's
//  worth of bytes before scanning.
void test_short_window_restarts_waiting ()
{
    resync::ingress_t ingress;
    resync::options_t options;
    options.idle_ivl = 10;

    const bytes_t damaged = make_frame (2);
    bytes_t stream (damaged.begin () + 10, damaged.end ());
    append (stream, make_garbage (12, 0));
    push (ingress, stream);

    test_sink_t sink;
    resync::resynchronizer_t runner (ingress, options, &sink);
    resync::thread_t worker;
    worker.start (run_routine, &runner, "resync");

    msleep (SETTLE_TIME / 3);
    TEST_ASSERT_EQUAL_UINT64 (1, runner.short_frames ());
    TEST_ASSERT_EQUAL_UINT64 (12, runner.consumed_bytes ());
    TEST_ASSERT_EQUAL_INT (resync::resynchronizer_t::waiting_for_data,
                           runner.state ());
    TEST_ASSERT_EQUAL_UINT (12, ingress.size ());

    //  Completing the frame lets the scan continue.
    push (ingress, make_frame (5));
    msleep (SETTLE_TIME / 3);
    TEST_ASSERT_EQUAL_UINT (1, sink.count ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (&make_frame (5)[0], &sink.at (0)[0],
                                  default_frame_size);
    TEST_ASSERT_EQUAL_UINT64 (12, runner.trimmed_bytes ());

    runner.stop ();
    worker.stop ();
    TEST_ASSERT_EQUAL_INT (resync::resynchronizer_t::stopped, runner.state ());
}

void test_run_delivers_to_sink_in_order ()
{
    resync::ingress_t ingress;
    resync::options_t options;
    test_sink_t sink;
    resync::resynchronizer_t r (ingress, options, &sink);

    resync::thread_t worker;
    worker.start (run_routine, &r, "resync");

    const size_t frame_count = 50;
    for (size_t i = 0; i < frame_count; ++i) {
        const bytes_t frame = make_frame (static_cast<unsigned char> (i));
        ingress.push (&frame[0], 9);
        ingress.push (&frame[9], frame.size () - 9);
    }

    for (int i = 0; i < 400 && sink.count () < frame_count; ++i)
        msleep (5);

    r.stop ();
    worker.stop ();

    TEST_ASSERT_EQUAL_UINT (frame_count, sink.count ());
    for (size_t i = 0; i < frame_count; ++i) {
        const bytes_t expected = make_frame (static_cast<unsigned char> (i));
        TEST_ASSERT_EQUAL_HEX8_ARRAY (&expected[0], &sink.at (i)[0],
                                      expected.size ());
    }
}

//  stop () interrupts a scan in progress; the window is discarded.
void test_stop_while_scanning ()
{
    resync::ingress_t ingress;
    resync::options_t options;
    options.idle_ivl = 1000;
    test_sink_t sink;
    resync::resynchronizer_t r (ingress, options, &sink);

    resync::thread_t worker;
    worker.start (run_routine, &r, "resync");

    push (ingress, make_garbage (30, 0));
    for (int i = 0; i < 400 && r.consumed_bytes () < 30; ++i)
        msleep (5);
    TEST_ASSERT_EQUAL_INT (resync::resynchronizer_t::scanning, r.state ());

    r.stop ();
    worker.stop ();
    TEST_ASSERT_EQUAL_INT (resync::resynchronizer_t::stopped, r.state ());
    TEST_ASSERT_EQUAL_UINT (0, sink.count ());

    resync::frame_t frame;
    TEST_ASSERT_EQUAL_INT (-1, r.next_frame (&frame));
    TEST_ASSERT_EQUAL_INT (ETERM, errno);
}

void test_stop_before_enough_data ()
{
    resync::ingress_t ingress;
    resync::options_t options;
    resync::resynchronizer_t r (ingress, options, NULL);

    push (ingress, make_garbage (5, 0));
    r.stop ();

    resync::frame_t frame;
    TEST_ASSERT_EQUAL_INT (-1, r.next_frame (&frame));
    TEST_ASSERT_EQUAL_INT (ETERM, errno);
    TEST_ASSERT_EQUAL_UINT64 (0, r.consumed_bytes ());
    TEST_ASSERT_EQUAL_UINT (5, ingress.size ());
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_next_frame_cycles);
    RUN_TEST (test_short_window_restarts_waiting);
    RUN_TEST (test_run_delivers_to_sink_in_order);
    RUN_TEST (test_stop_while_scanning);
    RUN_TEST (test_stop_before_enough_data);
    return UNITY_END ();
}
