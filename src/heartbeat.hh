#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cstdint>
#include <atomic>
#include <thread>

#include "commons.hh"
#include "io.hh"

namespace beatwatch {

    //
    // HeartRunner periodically beats a Heart from its own thread.
    // The Heart is borrowed, it must outlive the runner.
    // The number of beats sent so far is kept in an atomic counter, so that
    //  other threads can peek at it while the runner is beating.
    class HeartRunner {
    private:
        const Duration          interval;
        Heart&                  heart;

        std::atomic<uint64_t>   beats;
        std::atomic<bool>       alive;
        std::atomic<int>        last_ret;

        std::thread             runner;
        std::thread::native_handle_type
                                runner_handle;

    public:
        HeartRunner(Heart&, Duration);
        ~HeartRunner();

        void doLaunchRunner();
        void doKillRunner();

        uint64_t doPeek() const;
        int getLastRet() const;
        bool isAlive() const;
    };
}
