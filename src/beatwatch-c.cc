/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <stdint.h>

#include <atomic>
#include <memory>
#include <thread>

#include "beatwatch-c.h"
#include "beatwatch.hh"

//
// This is C-Wrapper for a UDP Watchdog and a UDP Heart.

namespace beatwatch {

    // A watchdog handed to C, with the thread that runs it.
    struct CwWatchdog {
        std::unique_ptr<Watchdog>   watchdog;
        StateReceiver               state_rx;

        std::thread                 runner;
        std::atomic<int>            run_ret;

        uint16_t                    port;

        CwWatchdog(Watchdog* arg_watchdog, uint16_t arg_port) :
            watchdog(arg_watchdog), state_rx(arg_watchdog->getStateRx()), run_ret(RETCODE_OK), port(arg_port) { }
    };
}



/// @brief Creates a watchdog listening for beats on host:port.
/// @param arg_host
/// @param arg_port
/// @param arg_interval_ms
/// @param arg_window_ms    0 selects the default timeout range.
/// @return nullptr if the socket cannot be bound.
void* cwCreateUdpWatchdog(const char* arg_host, uint16_t arg_port, uint32_t arg_interval_ms, uint32_t arg_window_ms) {

    beatwatch::WatchdogConfig config{std::chrono::milliseconds(arg_interval_ms)};
    if (arg_window_ms != 0)
        config.setRange(beatwatch::Range::makeWindow(std::chrono::milliseconds(arg_window_ms)));

    std::unique_ptr<beatwatch::UdpIo> io(new beatwatch::UdpIo(arg_host, arg_port, config.getIoTimeout()));
    if (io->doOpen() != beatwatch::RETCODE_OK)
        return nullptr;

    uint16_t port = io->getBoundPort();

    return reinterpret_cast<void*>(
        new beatwatch::CwWatchdog(new beatwatch::Watchdog(config, std::move(io)), port));
}

uint16_t cwGetWatchdogPort(void* arg_wd) {
    return reinterpret_cast<beatwatch::CwWatchdog*>(arg_wd)->port;
}

int cwLaunchWatchdog(void* arg_wd) {

    auto wd = reinterpret_cast<beatwatch::CwWatchdog*>(arg_wd);
    if (wd->runner.joinable())
        return beatwatch::RETCODE_FAILED;

    wd->runner = std::thread([wd]() {
        wd->run_ret.store(wd->watchdog->doRun());
    });

    return beatwatch::RETCODE_OK;
}

int cwGetWatchdogState(void* arg_wd) {
    auto wd = reinterpret_cast<beatwatch::CwWatchdog*>(arg_wd);
    return beatwatch::stateToBool(wd->watchdog->getState()) ? 1 : 0;
}

int cwPollWatchdogEvent(void* arg_wd, int* arg_state, int* arg_kind) {

    auto wd = reinterpret_cast<beatwatch::CwWatchdog*>(arg_wd);
    beatwatch::StateEvent event;

    if (!wd->state_rx.doTryRecv(event))
        return 0;

    *arg_state  = static_cast<int>(event.state);
    *arg_kind   = static_cast<int>(event.kind);

    return 1;
}

int cwStopWatchdog(void* arg_wd) {

    auto wd = reinterpret_cast<beatwatch::CwWatchdog*>(arg_wd);

    wd->watchdog->doStop();
    if (wd->runner.joinable())
        wd->runner.join();

    return wd->run_ret.load();
}

void cwDestroyWatchdog(void* arg_wd) {

    auto wd = reinterpret_cast<beatwatch::CwWatchdog*>(arg_wd);

    cwStopWatchdog(arg_wd);
    delete wd;
}



void* cwCreateUdpHeart(const char* arg_host, uint16_t arg_port) {

    beatwatch::UdpHeart* heart = new beatwatch::UdpHeart(arg_host, arg_port);
    if (heart->doOpen() != beatwatch::RETCODE_OK) {
        delete heart;
        return nullptr;
    }

    return reinterpret_cast<void*>(heart);
}

int cwBeat(void* arg_heart) {
    return reinterpret_cast<beatwatch::UdpHeart*>(arg_heart)->doBeat();
}

void cwDestroyHeart(void* arg_heart) {
    delete reinterpret_cast<beatwatch::UdpHeart*>(arg_heart);
}
