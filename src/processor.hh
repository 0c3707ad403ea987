#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cstdint>
#include <chrono>

#include "commons.hh"
#include "config.hh"

namespace beatwatch {

    typedef std::chrono::steady_clock::time_point   TimePoint;

    //
    // WatchdogProcessor decides, for one poll outcome, whether the published state
    //  has to change. It does not block and does not touch the published state, so
    //  it needs no synchronization: it lives on the run loop's stack.
    //
    //  - packets: consecutive accepted edges since the last fault.
    //  - next:    edge the peer has to send next, starts at Rising.
    //  - last_poll: instant of the previous call, reset on every call.
    //
    // Recovery needs min_beats full cycles, and a cycle is two edges.
    class WatchdogProcessor {
    private:
        const WatchdogConfig&   config;

        uint32_t                packets;
        Edge                    next;
        TimePoint               last_poll;

    public:
        WatchdogProcessor(const WatchdogConfig&);
        WatchdogProcessor(const WatchdogConfig&, TimePoint);
        ~WatchdogProcessor() { }

        int doProcess(const PollResult&, State, StateEvent&, bool&);
        int doProcess(const PollResult&, State, StateEvent&, bool&, TimePoint);

        Edge getNext() const;
        uint32_t getPackets() const;
    };
}
