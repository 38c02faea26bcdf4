/* SPDX-License-Identifier: MPL-2.0 */

#include <resync.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

// --- Stopwatch ---
class stopwatch_t {
public:
    void start() { _start = std::chrono::high_resolution_clock::now(); }
    double elapsed_ms() const {
        auto end = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double, std::milli>(end - _start).count();
    }
private:
    std::chrono::high_resolution_clock::time_point _start;
};

static void print_result(const std::string& pattern, size_t frame_size,
                         double throughput, double mbps) {
    std::cout << "RESULT,libresync," << pattern << "," << frame_size
              << ",throughput," << std::fixed << std::setprecision(2) << throughput << std::endl;
    std::cout << "RESULT,libresync," << pattern << "," << frame_size
              << ",mbps," << std::fixed << std::setprecision(2) << mbps << std::endl;
}

static uint64_t get_stat(void *session, int option) {
    uint64_t value = 0;
    size_t size = sizeof(value);
    resync_getopt(session, option, &value, &size);
    return value;
}

// Builds the byte stream: frames with a garbage burst every garbage_every
// frames. Payload and garbage bytes never contain the marker "hi".
static std::vector<unsigned char> build_stream(size_t frame_size, int frame_count,
                                               int garbage_every, std::mt19937& rng) {
    std::vector<unsigned char> stream;
    stream.reserve(static_cast<size_t>(frame_count) * (frame_size + 8));
    std::uniform_int_distribution<int> letter('A', 'Z');
    std::uniform_int_distribution<int> garbage_len(1, 40);

    for (int i = 0; i < frame_count; ++i) {
        if (garbage_every > 0 && i % garbage_every == 0) {
            const int n = garbage_len(rng);
            for (int j = 0; j < n; ++j)
                stream.push_back(static_cast<unsigned char>('0' + j % 10));
        }
        for (size_t j = 0; j + 2 < frame_size; ++j)
            stream.push_back(static_cast<unsigned char>(letter(rng)));
        stream.push_back('h');
        stream.push_back('i');
    }
    return stream;
}

static void run_bench(size_t frame_size, int frame_count, int garbage_every) {
    void *session = resync_new();
    const int fs = static_cast<int>(frame_size);
    resync_setopt(session, RESYNC_FRAME_SIZE, &fs, sizeof(fs));
    const int timeout = 5000;
    resync_setopt(session, RESYNC_RCVTIMEO, &timeout, sizeof(timeout));
    if (resync_start(session) != 0) {
        std::fprintf(stderr, "resync_start: %s\n", resync_strerror(resync_errno()));
        resync_close(session);
        return;
    }

    std::mt19937 rng(42);
    const std::vector<unsigned char> stream =
      build_stream(frame_size, frame_count, garbage_every, rng);

    stopwatch_t sw;
    sw.start();

    // Producer pushes in random chunk sizes, like a serial receive callback.
    std::thread producer([&]() {
        std::mt19937 chunk_rng(7);
        std::uniform_int_distribution<size_t> chunk(1, 512);
        size_t offset = 0;
        while (offset < stream.size()) {
            size_t n = chunk(chunk_rng);
            if (n > stream.size() - offset)
                n = stream.size() - offset;
            resync_push(session, &stream[offset], n);
            offset += n;
        }
    });

    std::vector<unsigned char> buf(frame_size);
    int received = 0;
    while (received < frame_count) {
        if (resync_recv(session, buf.data(), buf.size(), 0) < 0)
            break;
        ++received;
    }
    producer.join();

    const double elapsed = sw.elapsed_ms();
    const double throughput = received / (elapsed / 1000.0);
    const double mbps = (stream.size() / (1024.0 * 1024.0)) / (elapsed / 1000.0);

    const std::string pattern = garbage_every > 0 ? "GARBAGE" : "CLEAN";
    print_result(pattern, frame_size, throughput, mbps);
    if (received != frame_count)
        std::fprintf(stderr, "received %d of %d frames (short=%llu)\n", received,
                     frame_count,
                     static_cast<unsigned long long>(get_stat(session, RESYNC_SHORT_FRAMES)));

    resync_close(session);
}

int main(int argc, char *argv[]) {
    const int frame_count = argc > 1 ? std::atoi(argv[1]) : 200000;
    static const size_t frame_sizes[] = {22, 64, 256, 1024};

    for (size_t i = 0; i < sizeof(frame_sizes) / sizeof(frame_sizes[0]); ++i) {
        run_bench(frame_sizes[i], frame_count, 0);
        run_bench(frame_sizes[i], frame_count, 10);
    }
    return 0;
}
