/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <thread>

#include <boost/asio/post.hpp>

#include "local-line.hh"

void beatwatch::LocalLine::doWrite(bool arg_level) { level.store(arg_level ? 1 : 0); }
bool beatwatch::LocalLine::doRead() const { return level.load() != 0; }



beatwatch::LocalLineHeart::LocalLineHeart(LocalLine& arg_line) : line(arg_line), next(1) { }

int beatwatch::LocalLineHeart::doBeat() {
    line.doWrite(next.fetch_xor(1) != 0);
    return RETCODE_OK;
}



/* LocalLineIo */
beatwatch::LocalLineIo::LocalLineIo(const LocalLine& arg_line, Duration arg_timeout, Duration arg_pull) :
    line(arg_line), timeout(arg_timeout), pull_interval(arg_pull) { }

int beatwatch::LocalLineIo::doGet(Edge arg_expected, Edge& arg_edge) {

    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    while ((std::chrono::steady_clock::now() - start) <= timeout) {

        Edge sampled = edgeFromBool(line.doRead());
        if (sampled == arg_expected) {
            arg_edge = sampled;
            return RETCODE_OK;
        }

        std::this_thread::sleep_for(pull_interval);
    }

    return RETCODE_TIMEOUT;
}

int beatwatch::LocalLineIo::doClear() { return RETCODE_OK; }



/* LocalLineIoAsync */
beatwatch::LocalLineIoAsync::LocalLineIoAsync(
        boost::asio::io_context& arg_io_ctx, const LocalLine& arg_line, Duration arg_timeout, Duration arg_pull
    ) : io_ctx(arg_io_ctx), pull_timer(arg_io_ctx), line(arg_line), timeout(arg_timeout), pull_interval(arg_pull) { }

void beatwatch::LocalLineIoAsync::doAsyncGet(Edge arg_expected, GetHandler arg_handler) {

    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    boost::asio::post(io_ctx, [this, arg_expected, start, arg_handler]() {
        __sample(arg_expected, start, arg_handler);
    });
}

void beatwatch::LocalLineIoAsync::__sample(
        Edge arg_expected, std::chrono::steady_clock::time_point arg_start, GetHandler arg_handler
    ) {

    Edge sampled = edgeFromBool(line.doRead());
    if (sampled == arg_expected) {
        arg_handler(RETCODE_OK, sampled);
        return;
    }

    if ((std::chrono::steady_clock::now() - arg_start) > timeout) {
        arg_handler(RETCODE_TIMEOUT, sampled);
        return;
    }

    pull_timer.expires_after(pull_interval);
    pull_timer.async_wait([this, arg_expected, arg_start, arg_handler](const boost::system::error_code& arg_ec) {

        if (arg_ec) {
            arg_handler(RETCODE_FAILED, arg_expected);
            return;
        }

        __sample(arg_expected, arg_start, arg_handler);
    });
}

void beatwatch::LocalLineIoAsync::doAsyncClear(ClearHandler arg_handler) {
    boost::asio::post(io_ctx, [arg_handler]() { arg_handler(RETCODE_OK); });
}
