/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cstdlib>

#include <atomic>
#include <thread>
#include <memory>
#include <iostream>

#include "../beatwatch.hh"

//
// Main.
//  local-demo <interval ms> <seconds>
//  Heart and watchdog over an in-process line. The heart stops for the middle
//  third of the run.
int main(int argc, char *argv[]) {

    const int INTERVAL_MS = (argc > 1) ? atoi(argv[1]) : 50;
    const int DURATION_SEC = (argc > 2) ? atoi(argv[2]) : 6;

    const std::chrono::milliseconds interval(INTERVAL_MS);

    beatwatch::LocalLine line;
    beatwatch::LocalLineHeart heart(line);
    beatwatch::HeartRunner hb_runner(heart, interval);

    beatwatch::WatchdogConfig config(interval);
    if (!config.isValid()) {
        std::cout << "Invalid interval: " << INTERVAL_MS << " ms\n";
        return -1;
    }

    beatwatch::Watchdog watchdog(config, std::unique_ptr<beatwatch::WatchdogIo>(
        new beatwatch::LocalLineIo(line, config.getIoTimeout(), std::chrono::milliseconds(1))));

    beatwatch::StateReceiver state_rx = watchdog.getStateRx();

    int run_ret = beatwatch::RETCODE_OK;
    std::thread runner([&watchdog, &run_ret]() { run_ret = watchdog.doRun(); });

    std::atomic<bool> printing(true);
    std::thread printer([&state_rx, &printing]() {
        beatwatch::StateEvent event;
        while (printing.load()) {
            if (state_rx.doRecv(event, std::chrono::milliseconds(100)) != beatwatch::RETCODE_OK)
                continue;

            if (event.isOk())
                std::cout << "[" << beatwatch::strState(event.state) << "]\n";
            else
                std::cout << "[" << beatwatch::strState(event.state) << "] "
                    << beatwatch::strFaultKind(event.kind) << "\n";
        }
    });

    const std::chrono::milliseconds third(DURATION_SEC * 1000 / 3);

    hb_runner.doLaunchRunner();
    std::this_thread::sleep_for(third);

    std::cout << "Heart stopped, beats: " << hb_runner.doPeek() << "\n";
    hb_runner.doKillRunner();
    std::this_thread::sleep_for(third);

    std::cout << "Heart resumed.\n";
    hb_runner.doLaunchRunner();
    std::this_thread::sleep_for(third);

    hb_runner.doKillRunner();
    watchdog.doStop();
    runner.join();

    printing.store(false);
    printer.join();

    std::cout << "Watchdog stopped: " << beatwatch::strRetcode(run_ret) << "\n";
    return 0;
}
