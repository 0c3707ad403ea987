#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <atomic>
#include <memory>
#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "commons.hh"
#include "config.hh"
#include "channel.hh"
#include "processor.hh"
#include "io.hh"

namespace beatwatch {

    typedef std::function<void(int)>    RunHandler;

    //
    // Watchdog, cooperative variant. Same algorithm as Watchdog, driven by a
    //  boost::asio::io_context instead of a dedicated thread.
    // The loop is a chain of completion handlers; it suspends only in the
    //  backend's doAsyncGet()/doAsyncClear() and in the warm-up timer. The
    //  processor call between them runs to completion, so nothing interleaves
    //  with it on a single-threaded io_context.
    //
    // The instance must outlive the io_context's processing of its handlers.
    class WatchdogAsync {
    private:
        boost::asio::io_context&            io_ctx;
        boost::asio::steady_timer           warmup_timer;

        const WatchdogConfig                config;
        std::unique_ptr<WatchdogIoAsync>    io;

        std::atomic<bool>                   state;          // true: STATE_OK
        StateSender                         state_tx;

        std::unique_ptr<WatchdogProcessor>  processor;      // Alive while running.
        RunHandler                          run_handler;

        std::atomic<bool>                   stop_requested;
        std::atomic<bool>                   running;

        void __poll();
        void __onPolled(int, Edge);

        int __setOk();
        void __setFault(FaultKind, std::function<void()>);
        void __warmup(std::function<void()>);

        void __finish(int);

    public:
        WatchdogAsync(boost::asio::io_context&, const WatchdogConfig&, std::unique_ptr<WatchdogIoAsync>);
        ~WatchdogAsync();

        int doRun(RunHandler);          // Schedules the loop. The handler gets its final retcode.
        void doStop();                  // Safe to call from any thread. Consumed when the run ends.

        State getState() const;
        const std::atomic<bool>& getStateRef() const;
        StateReceiver getStateRx() const;

        bool isRunning() const;
    };
}
