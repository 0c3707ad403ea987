/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <netdb.h>
#include <fcntl.h>
#include <sys/time.h>
#include <netinet/in.h>

#include <memory>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address.hpp>

#include "logger.hh"
#include "udp.hh"

namespace beatwatch {
    static Logger UDP_LOGGER("BEATWATCH/UDP", "beatwatch_udp.log");
}



/// @brief Resolves host:port into an IPv4/IPv6 datagram address.
/// @param arg_host
/// @param arg_port
/// @param arg_addr
/// @param arg_len
/// @return RETCODE_OK, or RETCODE_FAILED if the address cannot be resolved.
int beatwatch::resolveUdpAddress(
        const std::string& arg_host, uint16_t arg_port, struct sockaddr_storage& arg_addr, socklen_t& arg_len) {

    struct addrinfo hints;
    struct addrinfo* result = nullptr;

    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family     = AF_UNSPEC;
    hints.ai_socktype   = SOCK_DGRAM;
    hints.ai_flags      = AI_NUMERICSERV;

    std::string service = std::to_string(arg_port);

    int ret = getaddrinfo(arg_host.c_str(), service.c_str(), &hints, &result);
    if (ret != 0 || result == nullptr) {
        BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Cannot resolve {}:{}: {}", arg_host, arg_port, gai_strerror(ret));
        return RETCODE_FAILED;
    }

    std::memcpy(&arg_addr, result->ai_addr, result->ai_addrlen);
    arg_len = result->ai_addrlen;

    freeaddrinfo(result);
    return RETCODE_OK;
}



/* UdpHeart */
beatwatch::UdpHeart::UdpHeart(std::string arg_host, uint16_t arg_port) :
    host(arg_host), port(arg_port), sock_fd(-1), next(1) { }

beatwatch::UdpHeart::~UdpHeart() { doClose(); }

int beatwatch::UdpHeart::doOpen() {

    // Reopening replaces the socket.
    doClose();

    struct sockaddr_storage addr;
    socklen_t addr_len = 0;

    int ret = resolveUdpAddress(host, port, addr, addr_len);
    if (ret != RETCODE_OK)
        return ret;

    sock_fd = socket(addr.ss_family, SOCK_DGRAM, 0);
    if (sock_fd < 0) {
        BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Heart socket failed: {}", std::strerror(errno));
        return RETCODE_IO;
    }

    if (connect(sock_fd, reinterpret_cast<struct sockaddr*>(&addr), addr_len) != 0) {
        BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Heart connect to {}:{} failed: {}", host, port, std::strerror(errno));
        doClose();
        return RETCODE_IO;
    }

    BEATWATCH_LOGGER_INFO(UDP_LOGGER, "Heart beating to {}:{}", host, port);
    return RETCODE_OK;
}

void beatwatch::UdpHeart::doClose() {
    if (sock_fd >= 0) {
        close(sock_fd);
        sock_fd = -1;
    }
}

int beatwatch::UdpHeart::doBeat() {

    if (sock_fd < 0)
        return RETCODE_FAILED;

    uint8_t byte = static_cast<uint8_t>(edgeFromBool(next.fetch_xor(1) != 0));

    if (send(sock_fd, &byte, 1, 0) < 0) {

        // An ICMP port unreachable from a previous beat: nobody listens yet.
        //  The beat is lost like any datagram, the heart keeps beating.
        if (errno == ECONNREFUSED) {
            BEATWATCH_LOGGER_DEBUG(UDP_LOGGER, "Beat refused by {}:{}", host, port);
            return RETCODE_OK;
        }

        BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Beat failed: {}", std::strerror(errno));
        return RETCODE_IO;
    }

    return RETCODE_OK;
}



/* UdpIo */
beatwatch::UdpIo::UdpIo(std::string arg_host, uint16_t arg_port, Duration arg_timeout) :
    host(arg_host), port(arg_port), timeout(arg_timeout), sock_fd(-1) { }

beatwatch::UdpIo::~UdpIo() { doClose(); }

int beatwatch::UdpIo::doOpen() {

    // Reopening replaces the socket.
    doClose();

    struct sockaddr_storage addr;
    socklen_t addr_len = 0;

    int ret = resolveUdpAddress(host, port, addr, addr_len);
    if (ret != RETCODE_OK)
        return ret;

    sock_fd = socket(addr.ss_family, SOCK_DGRAM, 0);
    if (sock_fd < 0) {
        BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Watchdog socket failed: {}", std::strerror(errno));
        return RETCODE_IO;
    }

    if (bind(sock_fd, reinterpret_cast<struct sockaddr*>(&addr), addr_len) != 0) {
        BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Bind to {}:{} failed: {}", host, port, std::strerror(errno));
        doClose();
        return RETCODE_IO;
    }

    struct timeval tv;
    tv.tv_sec   = static_cast<time_t>(timeout.count() / 1000000);
    tv.tv_usec  = static_cast<suseconds_t>(timeout.count() % 1000000);

    if (setsockopt(sock_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Receive timeout failed: {}", std::strerror(errno));
        doClose();
        return RETCODE_IO;
    }

    BEATWATCH_LOGGER_INFO(UDP_LOGGER, "Watchdog listening on {}:{} (timeout {} us)", host, getBoundPort(), timeout.count());
    return RETCODE_OK;
}

void beatwatch::UdpIo::doClose() {
    if (sock_fd >= 0) {
        close(sock_fd);
        sock_fd = -1;
    }
}

int beatwatch::UdpIo::doGet(Edge arg_expected, Edge& arg_edge) {

    uint8_t byte = 0;
    ssize_t nbytes;

    if (sock_fd < 0)
        return RETCODE_FAILED;

    while (1) {
        nbytes = recv(sock_fd, &byte, 1, 0);

        if (nbytes > 0)
            break;

        if (nbytes == 0)            // Empty datagram.
            continue;

        if (errno == EINTR)
            continue;

        int ret = retcodeFromErrno(errno);
        if (ret != RETCODE_TIMEOUT)
            BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Receive failed: {}", std::strerror(errno));

        return ret;
    }

    arg_edge = edgeFromByte(byte);
    return RETCODE_OK;
}



/// @brief Drains every queued datagram without blocking.
/// @return
int beatwatch::UdpIo::doClear() {

    uint8_t byte;
    int drained = 0;

    if (sock_fd < 0)
        return RETCODE_FAILED;

    while (1) {
        if (recv(sock_fd, &byte, 1, MSG_DONTWAIT) >= 0) {
            drained++;
            continue;
        }

        if (errno == EINTR)
            continue;

        if (errno == EAGAIN || errno == EWOULDBLOCK)
            break;

        BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Clear failed: {}", std::strerror(errno));
        return RETCODE_IO;
    }

    if (drained > 0)
        BEATWATCH_LOGGER_DEBUG(UDP_LOGGER, "Cleared {} stale datagram(s).", drained);

    return RETCODE_OK;
}

uint16_t beatwatch::UdpIo::getBoundPort() const {

    struct sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);

    if (sock_fd < 0 || getsockname(sock_fd, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) != 0)
        return 0;

    if (addr.ss_family == AF_INET6)
        return ntohs(reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_port);

    return ntohs(reinterpret_cast<struct sockaddr_in*>(&addr)->sin_port);
}



/* UdpIoAsync */
beatwatch::UdpIoAsync::UdpIoAsync(
        boost::asio::io_context& arg_io_ctx, std::string arg_host, uint16_t arg_port, Duration arg_timeout
    ) : io_ctx(arg_io_ctx), socket(arg_io_ctx), deadline(arg_io_ctx),
        host(arg_host), port(arg_port), timeout(arg_timeout) {
    rx_buf[0] = 0;
}

beatwatch::UdpIoAsync::~UdpIoAsync() { doClose(); }

int beatwatch::UdpIoAsync::doOpen() {

    doClose();

    boost::system::error_code ec;
    boost::asio::ip::address addr = boost::asio::ip::make_address(host, ec);
    if (ec) {
        BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Bad address {}: {}", host, ec.message());
        return RETCODE_FAILED;
    }

    boost::asio::ip::udp::endpoint endpoint(addr, port);

    socket.open(endpoint.protocol(), ec);
    if (!ec)
        socket.bind(endpoint, ec);

    if (ec) {
        BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Bind to {}:{} failed: {}", host, port, ec.message());
        doClose();
        return RETCODE_IO;
    }

    BEATWATCH_LOGGER_INFO(UDP_LOGGER, "Async watchdog listening on {}:{} (timeout {} us)", host, getBoundPort(), timeout.count());
    return RETCODE_OK;
}

void beatwatch::UdpIoAsync::doClose() {
    boost::system::error_code ec;
    if (socket.is_open())
        socket.close(ec);
}



/// @brief Receives one beat. When the deadline fires first, it cancels the receive,
///  which then completes with operation_aborted and is reported as RETCODE_TIMEOUT.
/// @param arg_expected
/// @param arg_handler
void beatwatch::UdpIoAsync::doAsyncGet(Edge arg_expected, GetHandler arg_handler) {

    if (!socket.is_open()) {
        boost::asio::post(io_ctx, [arg_handler, arg_expected]() { arg_handler(RETCODE_FAILED, arg_expected); });
        return;
    }

    std::shared_ptr<bool> received = std::make_shared<bool>(false);

    deadline.expires_after(timeout);
    deadline.async_wait([this, received](const boost::system::error_code& arg_ec) {
        if (arg_ec || *received)
            return;

        boost::system::error_code ec;
        socket.cancel(ec);
    });

    socket.async_receive(boost::asio::buffer(rx_buf),
        [this, received, arg_expected, arg_handler](const boost::system::error_code& arg_ec, std::size_t arg_nbytes) {

            *received = true;
            deadline.cancel();

            if (arg_ec == boost::asio::error::operation_aborted) {
                arg_handler(RETCODE_TIMEOUT, arg_expected);
                return;
            }

            if (arg_ec) {
                BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Receive failed: {}", arg_ec.message());
                arg_handler(RETCODE_IO, arg_expected);
                return;
            }

            if (arg_nbytes == 0) {      // Empty datagram.
                doAsyncGet(arg_expected, arg_handler);
                return;
            }

            arg_handler(RETCODE_OK, edgeFromByte(rx_buf[0]));
        });
}

void beatwatch::UdpIoAsync::doAsyncClear(ClearHandler arg_handler) {

    boost::asio::post(io_ctx, [this, arg_handler]() {

        boost::system::error_code ec;
        int drained = 0;

        while (socket.available(ec) > 0 && !ec) {
            socket.receive(boost::asio::buffer(rx_buf), 0, ec);
            if (ec)
                break;

            drained++;
        }

        if (ec) {
            BEATWATCH_LOGGER_ERROR(UDP_LOGGER, "Clear failed: {}", ec.message());
            arg_handler(RETCODE_IO);
            return;
        }

        if (drained > 0)
            BEATWATCH_LOGGER_DEBUG(UDP_LOGGER, "Cleared {} stale datagram(s).", drained);

        arg_handler(RETCODE_OK);
    });
}

uint16_t beatwatch::UdpIoAsync::getBoundPort() const {
    boost::system::error_code ec;
    boost::asio::ip::udp::endpoint endpoint = socket.local_endpoint(ec);

    return ec ? 0 : endpoint.port();
}
