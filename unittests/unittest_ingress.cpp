/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/ingress.hpp"
#include "core/thread.hpp"
#include "utils/clock.hpp"

#include <unity.h>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

void test_empty ()
{
    resync::ingress_t ingress;
    unsigned char byte = 0;
    TEST_ASSERT_FALSE (ingress.try_pop (&byte));
    TEST_ASSERT_EQUAL_UINT (0, ingress.size ());
    TEST_ASSERT_EQUAL_UINT (0, ingress.drain ());
}

void test_fifo_order ()
{
    resync::ingress_t ingress;
    const unsigned char first[] = {1, 2, 3};
    const unsigned char second[] = {4, 5};
    ingress.push (first, sizeof (first));
    ingress.push (second, sizeof (second));
    ingress.push (second, 0);
    TEST_ASSERT_EQUAL_UINT (5, ingress.size ());

    for (unsigned char expected = 1; expected <= 5; ++expected) {
        unsigned char byte = 0;
        TEST_ASSERT_TRUE (ingress.try_pop (&byte));
        TEST_ASSERT_EQUAL_UINT8 (expected, byte);
    }
    unsigned char byte = 0;
    TEST_ASSERT_FALSE (ingress.try_pop (&byte));
    TEST_ASSERT_EQUAL_UINT (0, ingress.size ());
}

//  Pushes larger than the pipe granularity span several chunks.
void test_large_push ()
{
    resync::ingress_t ingress;
    bytes_t data (3 * resync::ingress_granularity + 17);
    for (size_t i = 0; i < data.size (); ++i)
        data[i] = static_cast<unsigned char> (i * 7);
    ingress.push (&data[0], data.size ());
    TEST_ASSERT_EQUAL_UINT (data.size (), ingress.size ());

    for (size_t i = 0; i < data.size (); ++i) {
        unsigned char byte = 0;
        TEST_ASSERT_TRUE (ingress.try_pop (&byte));
        TEST_ASSERT_EQUAL_UINT8 (data[i], byte);
    }
}

void test_drain ()
{
    resync::ingress_t ingress;
    const bytes_t data = make_garbage (100, 0);
    ingress.push (&data[0], data.size ());
    TEST_ASSERT_EQUAL_UINT (100, ingress.drain ());
    TEST_ASSERT_EQUAL_UINT (0, ingress.size ());
}

void test_wait_ready_immediately ()
{
    resync::ingress_t ingress;
    const bytes_t data = make_garbage (10, 0);
    ingress.push (&data[0], data.size ());
    TEST_ASSERT_TRUE (ingress.wait (10, 0));
    TEST_ASSERT_TRUE (ingress.wait (10, -1));
}

void test_wait_times_out ()
{
    resync::ingress_t ingress;
    const bytes_t data = make_garbage (3, 0);
    ingress.push (&data[0], data.size ());

    const uint64_t start = resync::clock_t::now_us ();
    TEST_ASSERT_FALSE (ingress.wait (4, 50));
    const uint64_t elapsed_ms = (resync::clock_t::now_us () - start) / 1000;
    TEST_ASSERT_TRUE (elapsed_ms >= 40);
}

void test_wake_interrupts_wait ()
{
    resync::ingress_t ingress;

    //  A wake before the wait is not lost.
    ingress.wake ();
    TEST_ASSERT_FALSE (ingress.wait (1, -1));

    //  It is consumed by that wait.
    TEST_ASSERT_FALSE (ingress.wait (1, 10));
}

struct producer_args_t
{
    resync::ingress_t *ingress;
    const bytes_t *data;
    size_t chunk;
};

static void producer_routine (void *arg_)
{
    producer_args_t *args = static_cast<producer_args_t *> (arg_);
    const bytes_t &data = *args->data;
    for (size_t offset = 0; offset < data.size (); offset += args->chunk) {
        const size_t n = data.size () - offset < args->chunk
                           ? data.size () - offset
                           : args->chunk;
        args->ingress->push (&data[offset], n);
        if (offset % 1024 == 0)
            msleep (1);
    }
}

//  The consumer sees every byte in order while the producer is still
//  pushing, blocking in wait () whenever it runs dry.
void test_concurrent_producer_consumer ()
{
    resync::ingress_t ingress;
    bytes_t data (50000);
    for (size_t i = 0; i < data.size (); ++i)
        data[i] = static_cast<unsigned char> (i % 251);

    producer_args_t args = {&ingress, &data, 13};
    resync::thread_t producer;
    producer.start (producer_routine, &args, "producer");

    for (size_t i = 0; i < data.size (); ++i) {
        unsigned char byte = 0;
        while (!ingress.try_pop (&byte))
            ingress.wait (1, 100);
        TEST_ASSERT_EQUAL_UINT8 (data[i], byte);
    }
    producer.stop ();
    TEST_ASSERT_EQUAL_UINT (0, ingress.size ());
}

//  Bytes of producer p are 0x80 * p + (i % 0x80), so each byte names its
//  producer and its position modulo 0x80.
static bytes_t tagged_bytes (size_t size_, int producer_)
{
    bytes_t data (size_);
    for (size_t i = 0; i < size_; ++i)
        data[i] = static_cast<unsigned char> (0x80 * producer_ + i % 0x80);
    return data;
}

//  Two producers push concurrently; the bytes of each producer are seen
//  in their own order even though the streams interleave.
void test_two_producers_keep_relative_order ()
{
    resync::ingress_t ingress;
    const size_t per_producer = 30000;
    const bytes_t first = tagged_bytes (per_producer, 0);
    const bytes_t second = tagged_bytes (per_producer, 1);

    producer_args_t first_args = {&ingress, &first, 7};
    producer_args_t second_args = {&ingress, &second, 11};
    resync::thread_t first_producer;
    resync::thread_t second_producer;
    first_producer.start (producer_routine, &first_args, "producer-0");
    second_producer.start (producer_routine, &second_args, "producer-1");

    size_t seen[2] = {0, 0};
    for (size_t i = 0; i < 2 * per_producer; ++i) {
        unsigned char byte = 0;
        while (!ingress.try_pop (&byte))
            ingress.wait (1, 100);
        const int producer = byte >= 0x80 ? 1 : 0;
        TEST_ASSERT_EQUAL_UINT8 (seen[producer] % 0x80, byte & 0x7f);
        ++seen[producer];
    }
    first_producer.stop ();
    second_producer.stop ();

    TEST_ASSERT_EQUAL_UINT (per_producer, seen[0]);
    TEST_ASSERT_EQUAL_UINT (per_producer, seen[1]);
    TEST_ASSERT_EQUAL_UINT (0, ingress.size ());
}

static void pusher_routine (void *arg_)
{
    resync::ingress_t *ingress = static_cast<resync::ingress_t *> (arg_);
    msleep (50);
    const bytes_t data = make_garbage (22, 0);
    ingress->push (&data[0], 11);
    msleep (10);
    ingress->push (&data[11], 11);
}

//  A waiter for a threshold is woken once the threshold is reached, not
//  before.
void test_wait_for_threshold ()
{
    resync::ingress_t ingress;
    resync::thread_t pusher;
    pusher.start (pusher_routine, &ingress, "pusher");

    TEST_ASSERT_TRUE (ingress.wait (22, 5000));
    TEST_ASSERT_EQUAL_UINT (22, ingress.size ());
    pusher.stop ();
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_empty);
    RUN_TEST (test_fifo_order);
    RUN_TEST (test_large_push);
    RUN_TEST (test_drain);
    RUN_TEST (test_wait_ready_immediately);
    RUN_TEST (test_wait_times_out);
    RUN_TEST (test_wake_interrupts_wait);
    RUN_TEST (test_concurrent_producer_consumer);
    RUN_TEST (test_two_producers_keep_relative_order);
    RUN_TEST (test_wait_for_threshold);
    return UNITY_END ();
}
