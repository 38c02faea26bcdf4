/* SPDX-License-Identifier: MPL-2.0 */

//  Prints every frame recovered from a serial device as hex.
//
//  usage: resync_dump <device> [baud] [frame_size] [marker]

#include <resync.h>

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static volatile sig_atomic_t g_running = 1;

static void signal_handler(int) { g_running = 0; }

static void usage(const char *prog)
{
    std::fprintf(stderr,
                 "usage: %s <device> [baud] [frame_size] [marker]\n"
                 "  defaults: baud 115200, frame_size %d, marker \"hi\"\n",
                 prog, RESYNC_FRAME_SIZE_DFLT);
}

static void print_frame(const unsigned char *data, int size)
{
    for (int i = 0; i < size; ++i)
        std::printf("%02x%s", data[i], i + 1 < size ? " " : "\n");
    std::fflush(stdout);
}

static void print_stats(void *session)
{
    static const struct
    {
        int option;
        const char *name;
    } stats[] = {{RESYNC_FRAMES, "frames"},
                 {RESYNC_SHORT_FRAMES, "short"},
                 {RESYNC_TRIMMED_BYTES, "trimmed"},
                 {RESYNC_CONSUMED_BYTES, "consumed"},
                 {RESYNC_SOURCE_DROPPED, "dropped"}};

    for (size_t i = 0; i < sizeof(stats) / sizeof(stats[0]); ++i) {
        uint64_t value = 0;
        size_t size = sizeof(value);
        if (resync_getopt(session, stats[i].option, &value, &size) == 0)
            std::fprintf(stderr, "[resync_dump] %s=%llu\n", stats[i].name,
                         static_cast<unsigned long long>(value));
    }
}

int main(int argc, char *argv[])
{
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    const char *device = argv[1];
    const int baud = argc > 2 ? std::atoi(argv[2]) : 115200;
    const int frame_size = argc > 3 ? std::atoi(argv[3]) : RESYNC_FRAME_SIZE_DFLT;
    const std::string marker = argc > 4 ? argv[4] : "hi";

    void *session = resync_new();
    if (!session) {
        std::fprintf(stderr, "resync_new: %s\n", resync_strerror(resync_errno()));
        return 1;
    }

    //  Wake up regularly to notice a signal.
    const int rcvtimeo = 200;
    if (resync_setopt(session, RESYNC_FRAME_SIZE, &frame_size, sizeof(frame_size)) != 0
        || resync_setopt(session, RESYNC_MARKER, marker.data(), marker.size()) != 0
        || resync_setopt(session, RESYNC_RCVTIMEO, &rcvtimeo, sizeof(rcvtimeo)) != 0) {
        std::fprintf(stderr, "invalid option: %s\n", resync_strerror(resync_errno()));
        resync_close(session);
        return 1;
    }

    if (resync_attach_serial(session, device, baud) != 0) {
        std::fprintf(stderr, "cannot open %s: %s\n", device,
                     resync_strerror(resync_errno()));
        resync_close(session);
        return 1;
    }

    if (resync_start(session) != 0) {
        std::fprintf(stderr, "resync_start: %s\n", resync_strerror(resync_errno()));
        resync_close(session);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::fprintf(stderr, "[resync_dump] %s @ %d baud, frame_size=%d\n", device,
                 baud, frame_size);

    unsigned char buffer[RESYNC_MAX_FRAME_SIZE];
    while (g_running) {
        const int rc = resync_recv(session, buffer, sizeof(buffer), 0);
        if (rc >= 0) {
            print_frame(buffer, rc);
            continue;
        }
        if (resync_errno() == EAGAIN) {
            int error = 0;
            size_t size = sizeof(error);
            if (resync_getopt(session, RESYNC_SOURCE_ERROR, &error, &size) == 0
                && error != 0) {
                std::fprintf(stderr, "[resync_dump] source stopped: %s\n",
                             resync_strerror(error));
                break;
            }
            continue;
        }
        std::fprintf(stderr, "resync_recv: %s\n", resync_strerror(resync_errno()));
        break;
    }

    print_stats(session);
    resync_close(session);
    return 0;
}
