#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <condition_variable>

#include "commons.hh"
#include "config.hh"
#include "channel.hh"
#include "io.hh"

namespace beatwatch {

    //
    // Watchdog, blocking variant.
    // doRun() occupies the calling thread: it polls the backend for the next edge,
    //  hands the outcome to a WatchdogProcessor and publishes what it decides.
    // The published state is a single atomic bool, read lock-free by getState()
    //  from any thread. State events go to a latest-wins channel, see channel.hh.
    //
    // Every transition into Fault is followed by a warm-up: the loop sleeps for
    //  the configured warm-up and then clears the backend, so stale input queued
    //  while the peer was faulty is not taken for fresh beats.
    class Watchdog {
    private:
        const WatchdogConfig            config;
        std::unique_ptr<WatchdogIo>     io;

        std::atomic<bool>               state;          // true: STATE_OK
        StateSender                     state_tx;

        std::atomic<bool>               stop_requested;
        std::atomic<bool>               running;
        std::mutex                      stop_lock;
        std::condition_variable         stop_cv;

        int __run();
        int __setOk();
        int __setFault(FaultKind);
        int __warmup();

    public:
        Watchdog(const WatchdogConfig&, std::unique_ptr<WatchdogIo>);
        ~Watchdog();

        int doRun();                    // Returns only on a fatal error or after doStop().
        void doStop();                  // Ends the current run, or the next one if none is running.

        State getState() const;
        const std::atomic<bool>& getStateRef() const;
        StateReceiver getStateRx() const;

        const WatchdogConfig& getConfig() const;
        bool isRunning() const;
    };
}
