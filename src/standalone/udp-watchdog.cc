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
//  udp-watchdog <host> <port> <interval ms> [window ms]
//  A window of 0, or none, selects the default timeout range.
int main(int argc, char *argv[]) {

    if (argc < 4) {
        std::cout << "Usage: " << argv[0] << " <host> <port> <interval ms> [window ms]\n";
        return -1;
    }

    const char* HOST = argv[1];
    const int PORT = atoi(argv[2]);
    const int INTERVAL_MS = atoi(argv[3]);
    const int WINDOW_MS = (argc > 4) ? atoi(argv[4]) : 0;

    beatwatch::WatchdogConfig config{std::chrono::milliseconds(INTERVAL_MS)};
    if (WINDOW_MS > 0)
        config.setRange(beatwatch::Range::makeWindow(std::chrono::milliseconds(WINDOW_MS)));

    if (!config.isValid()) {
        std::cout << "Invalid interval: " << INTERVAL_MS << " ms\n";
        return -1;
    }

    std::unique_ptr<beatwatch::UdpIo> io(new beatwatch::UdpIo(HOST, static_cast<uint16_t>(PORT), config.getIoTimeout()));
    if (io->doOpen() != beatwatch::RETCODE_OK) {
        std::cout << "Cannot listen on " << HOST << ":" << PORT << "\n";
        return -1;
    }

    beatwatch::Watchdog watchdog(config, std::move(io));
    beatwatch::StateReceiver state_rx = watchdog.getStateRx();

    std::atomic<bool> running(true);
    std::atomic<int> run_ret(beatwatch::RETCODE_OK);

    std::thread runner([&watchdog, &running, &run_ret]() {
        run_ret.store(watchdog.doRun());
        running.store(false);
    });

    std::cout << "Watching " << HOST << ":" << PORT << ", interval " << INTERVAL_MS << " ms.\n";

    beatwatch::StateEvent event;
    while (running.load()) {

        if (state_rx.doRecv(event, std::chrono::seconds(1)) != beatwatch::RETCODE_OK)
            continue;

        if (event.isOk())
            std::cout << "[" << beatwatch::strState(event.state) << "]\n";
        else
            std::cout << "[" << beatwatch::strState(event.state) << "] "
                << beatwatch::strFaultKind(event.kind) << "\n";
    }

    runner.join();

    std::cout << "Watchdog terminated: " << beatwatch::strRetcode(run_ret.load()) << "\n";
    return run_ret.load() == beatwatch::RETCODE_OK ? 0 : -1;
}
