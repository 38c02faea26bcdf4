/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/serial/serial_source.hpp"
#include "core/ingress.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <boost/asio.hpp>

namespace
{
//  Translates a completion error into the errno reported to the user.
int to_errno (const boost::system::error_code &ec_)
{
    if (ec_ == boost::asio::error::eof)
        return EPIPE;
    if (ec_.category () == boost::system::system_category ())
        return ec_.value ();
    return EIO;
}
}

resync::serial_source_t::serial_source_t (ingress_t &ingress_) :
    _ingress (ingress_),
    _hwm (0),
    _terminating (false),
    _dropped_bytes (0),
    _error (0)
{
}

resync::serial_source_t::~serial_source_t ()
{
    stop ();
}

int resync::serial_source_t::open (const char *device_, int baud_)
{
    resync_assert (!_serial_port && !_stream_descriptor);

    std::unique_ptr<boost::asio::serial_port> port (
      new (std::nothrow) boost::asio::serial_port (_io_context));
    alloc_assert (port);

    boost::system::error_code ec;
    port->open (device_, ec);
    if (ec) {
        SOURCE_DBG ("open %s failed: %s", device_, ec.message ().c_str ());
        errno = to_errno (ec);
        return -1;
    }

    typedef boost::asio::serial_port_base base_t;
    port->set_option (base_t::baud_rate (static_cast<unsigned int> (baud_)),
                      ec);
    if (!ec)
        port->set_option (base_t::character_size (8), ec);
    if (!ec)
        port->set_option (base_t::parity (base_t::parity::none), ec);
    if (!ec)
        port->set_option (base_t::stop_bits (base_t::stop_bits::one), ec);
    if (!ec)
        port->set_option (
          base_t::flow_control (base_t::flow_control::none), ec);
    if (ec) {
        SOURCE_DBG ("configuring %s failed: %s", device_,
                    ec.message ().c_str ());
        errno = to_errno (ec);
        return -1;
    }

    _serial_port.swap (port);
    return 0;
}

int resync::serial_source_t::assign (int fd_)
{
    resync_assert (!_serial_port && !_stream_descriptor);

    std::unique_ptr<boost::asio::posix::stream_descriptor> descriptor (
      new (std::nothrow) boost::asio::posix::stream_descriptor (_io_context));
    alloc_assert (descriptor);

    boost::system::error_code ec;
    descriptor->assign (fd_, ec);
    if (ec) {
        errno = to_errno (ec);
        return -1;
    }

    _stream_descriptor.swap (descriptor);
    return 0;
}

void resync::serial_source_t::start (int hwm_)
{
    resync_assert (_serial_port || _stream_descriptor);
    resync_assert (!_worker.get_started ());

    _hwm = hwm_ > 0 ? static_cast<size_t> (hwm_) : 0;
    start_async_read ();
    _worker.start (worker_routine, this, "resync-source");
}

void resync::serial_source_t::stop ()
{
    if (_worker.get_started ()) {
        //  The close must run on the I/O thread; if that thread already
        //  ran out of work the handler is simply never invoked.
        boost::asio::post (_io_context, [this] () {
            _terminating = true;
            boost::system::error_code ec;
            if (_serial_port)
                _serial_port->close (ec);
            if (_stream_descriptor)
                _stream_descriptor->close (ec);
            if (ec)
                SOURCE_DBG ("close failed: %s", ec.message ().c_str ());
        });
        _worker.stop ();
    }

    _serial_port.reset ();
    _stream_descriptor.reset ();
}

void resync::serial_source_t::worker_routine (void *arg_)
{
    serial_source_t *self = static_cast<serial_source_t *> (arg_);
    self->_io_context.run ();
}

void resync::serial_source_t::start_async_read ()
{
    if (_serial_port) {
        _serial_port->async_read_some (
          boost::asio::buffer (_read_buffer, sizeof (_read_buffer)),
          [this] (const boost::system::error_code &ec, std::size_t bytes) {
              on_read_complete (ec, bytes);
          });
    } else {
        _stream_descriptor->async_read_some (
          boost::asio::buffer (_read_buffer, sizeof (_read_buffer)),
          [this] (const boost::system::error_code &ec, std::size_t bytes) {
              on_read_complete (ec, bytes);
          });
    }
}

void resync::serial_source_t::on_read_complete (
  const boost::system::error_code &ec, std::size_t bytes_transferred)
{
    SOURCE_DBG ("on_read_complete: ec=%s, bytes=%zu, terminating=%d",
                ec.message ().c_str (), bytes_transferred, _terminating);

    //  If terminating, just return - stop () is draining handlers
    if (_terminating)
        return;

    if (ec) {
        if (ec == boost::asio::error::operation_aborted)
            return;
        RESYNC_LOG_WARN ("read failed, source stopped: %s",
                         ec.message ().c_str ());
        _error.store (to_errno (ec));
        return;
    }

    if (bytes_transferred == 0) {
        //  Stream closed by peer
        _error.store (EPIPE);
        return;
    }

    if (_hwm > 0 && _ingress.size () + bytes_transferred > _hwm) {
        _dropped_bytes.fetch_add (bytes_transferred);
        SOURCE_DBG ("ingress above hwm, dropped %zu bytes", bytes_transferred);
    } else
        _ingress.push (_read_buffer, bytes_transferred);

    start_async_read ();
}
