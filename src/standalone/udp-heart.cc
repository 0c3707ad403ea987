/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cstdlib>

#include <thread>
#include <iostream>

#include "../beatwatch.hh"

//
// Main.
//  udp-heart <host> <port> <interval ms> [inject every N beats]
//  With N > 0, every N-th beat is followed by a fault injection, alternately
//  a silence of two intervals and an extra beat that breaks the window.
int main(int argc, char *argv[]) {

    if (argc < 4) {
        std::cout << "Usage: " << argv[0] << " <host> <port> <interval ms> [inject every N beats]\n";
        return -1;
    }

    const char* HOST = argv[1];
    const int PORT = atoi(argv[2]);
    const int INTERVAL_MS = atoi(argv[3]);
    const int INJECT_EVERY = (argc > 4) ? atoi(argv[4]) : 0;

    if (INTERVAL_MS <= 0) {
        std::cout << "Invalid interval: " << INTERVAL_MS << " ms\n";
        return -1;
    }

    beatwatch::UdpHeart heart(HOST, static_cast<uint16_t>(PORT));
    if (heart.doOpen() != beatwatch::RETCODE_OK) {
        std::cout << "Cannot reach " << HOST << ":" << PORT << "\n";
        return -1;
    }

    const std::chrono::milliseconds interval(INTERVAL_MS);
    std::chrono::steady_clock::time_point next_beat = std::chrono::steady_clock::now();

    std::cout << "Beating to " << HOST << ":" << PORT << ", interval " << INTERVAL_MS << " ms.\n";

    for (uint64_t nth_beat = 0; ; nth_beat++) {

        if (heart.doBeat() != beatwatch::RETCODE_OK) {
            std::cout << "Beat failed.\n";
            return -1;
        }

        if ((INJECT_EVERY > 0) && (nth_beat > 0) && (nth_beat % INJECT_EVERY == 0)) {
            if ((nth_beat / INJECT_EVERY) % 2 == 0) {
                std::cout << "Timing out\n";
                std::this_thread::sleep_for(interval * 2);
                next_beat = std::chrono::steady_clock::now();
            }
            else {
                std::cout << "Breaking the window\n";
                heart.doBeat();
            }
        }

        next_beat += interval;
        std::this_thread::sleep_until(next_beat);

        if (nth_beat % 100 == 0)
            std::cout << "\rBeats: " << nth_beat << std::flush;
    }

    return 0;
}
