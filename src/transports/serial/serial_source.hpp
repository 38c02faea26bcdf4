/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RESYNC_SERIAL_SOURCE_HPP_INCLUDED__
#define __RESYNC_SERIAL_SOURCE_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/serial_port.hpp>

#include "core/thread.hpp"
#include "utils/config.hpp"
#include "utils/macros.hpp"

namespace resync
{
class ingress_t;

//  Reference byte source. Reads a serial port or any readable descriptor
//  on its own I/O thread and pushes every completed read into the
//  ingress. It never reconnects: on EOF or a read error it records the
//  error and stops pushing.

class serial_source_t
{
  public:
    explicit serial_source_t (ingress_t &ingress_);
    ~serial_source_t ();

    //  Opens a serial device with the given baud rate, 8N1, no flow
    //  control. Returns -1 with errno set on failure.
    int open (const char *device_, int baud_);

    //  Takes ownership of an open descriptor.
    int assign (int fd_);

    //  Starts reading on the I/O thread. hwm_ is the number of buffered
    //  ingress bytes above which reads are dropped instead of pushed.
    //  Zero disables the limit.
    void start (int hwm_);

    //  Cancels the pending read and joins the I/O thread.
    void stop ();

    uint64_t dropped_bytes () const { return _dropped_bytes.load (); }

    //  errno of the failure that ended reading, 0 while healthy.
    int error () const { return _error.load (); }

  private:
    static void worker_routine (void *arg_);

    void start_async_read ();
    void on_read_complete (const boost::system::error_code &ec,
                           std::size_t bytes_transferred);

    ingress_t &_ingress;
    size_t _hwm;

    boost::asio::io_context _io_context;
    std::unique_ptr<boost::asio::serial_port> _serial_port;
    std::unique_ptr<boost::asio::posix::stream_descriptor> _stream_descriptor;

    unsigned char _read_buffer[source_read_size];

    thread_t _worker;
    bool _terminating;

    std::atomic<uint64_t> _dropped_bytes;
    std::atomic<int> _error;

    RESYNC_NON_COPYABLE_NOR_MOVABLE (serial_source_t)
};
}

#endif
