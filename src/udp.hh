#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cstdint>
#include <atomic>
#include <string>

#include <sys/socket.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ip/udp.hpp>

#include "commons.hh"
#include "io.hh"

namespace beatwatch {

    //
    // Wire convention: one datagram of one byte per beat, '+' for Rising and '.'
    //  for Falling (see edgeFromByte()). Anything longer is truncated to its
    //  first byte, empty datagrams are skipped.

    class UdpHeart : public Heart {
    private:
        const std::string       host;
        const uint16_t          port;

        int                     sock_fd;
        std::atomic<uint8_t>    next;       // 1: Rising

    public:
        UdpHeart(std::string, uint16_t);
        ~UdpHeart();

        int doOpen();
        void doClose();

        int doBeat();
    };

    //
    // Blocking datagram backend. The receive timeout of the socket is the I/O deadline.
    class UdpIo : public WatchdogIo {
    private:
        const std::string       host;
        const uint16_t          port;
        const Duration          timeout;

        int                     sock_fd;

    public:
        UdpIo(std::string, uint16_t, Duration);
        ~UdpIo();

        int doOpen();
        void doClose();

        int doGet(Edge, Edge&);
        int doClear();

        uint16_t getBoundPort() const;      // Useful when bound to port 0.
    };

    //
    // Datagram backend on a boost::asio::io_context. The deadline is a steady_timer
    //  that cancels the pending receive.
    class UdpIoAsync : public WatchdogIoAsync {
    private:
        boost::asio::io_context&        io_ctx;
        boost::asio::ip::udp::socket    socket;
        boost::asio::steady_timer       deadline;

        const std::string               host;
        const uint16_t                  port;
        const Duration                  timeout;

        uint8_t                         rx_buf[1];

    public:
        UdpIoAsync(boost::asio::io_context&, std::string, uint16_t, Duration);
        ~UdpIoAsync();

        int doOpen();
        void doClose();

        void doAsyncGet(Edge, GetHandler);
        void doAsyncClear(ClearHandler);

        uint16_t getBoundPort() const;
    };

    int resolveUdpAddress(const std::string&, uint16_t, struct sockaddr_storage&, socklen_t&);
}
