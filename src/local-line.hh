#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cstdint>
#include <atomic>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "commons.hh"
#include "io.hh"

namespace beatwatch {

    //
    // LocalLine is an in-process binary line, the software stand-in for a digital
    //  input wired to the peer's output. The heart drives the level, the watchdog
    //  samples it.
    class LocalLine {
    private:
        std::atomic<uint8_t>    level;

    public:
        LocalLine() : level(0) { }
        ~LocalLine() { }

        void doWrite(bool);
        bool doRead() const;
    };

    class LocalLineHeart : public Heart {
    private:
        LocalLine&              line;
        std::atomic<uint8_t>    next;       // 1: Rising

    public:
        LocalLineHeart(LocalLine&);
        ~LocalLineHeart() { }

        int doBeat();
    };

    //
    // Level-sampling backend. doGet() samples the line every pull interval until
    //  it reads the expected edge, or fails with RETCODE_TIMEOUT once the I/O
    //  deadline has passed. A level cannot be out of order; clearing is a no-op.
    class LocalLineIo : public WatchdogIo {
    private:
        const LocalLine&        line;
        const Duration          timeout;
        const Duration          pull_interval;

    public:
        LocalLineIo(const LocalLine&, Duration, Duration);
        ~LocalLineIo() { }

        int doGet(Edge, Edge&);
        int doClear();
    };

    class LocalLineIoAsync : public WatchdogIoAsync {
    private:
        boost::asio::io_context&    io_ctx;
        boost::asio::steady_timer   pull_timer;

        const LocalLine&            line;
        const Duration              timeout;
        const Duration              pull_interval;

        void __sample(Edge, std::chrono::steady_clock::time_point, GetHandler);

    public:
        LocalLineIoAsync(boost::asio::io_context&, const LocalLine&, Duration, Duration);
        ~LocalLineIoAsync() { }

        void doAsyncGet(Edge, GetHandler);
        void doAsyncClear(ClearHandler);
    };
}
