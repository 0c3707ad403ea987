#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cstdint>

#include <memory>
#include <mutex>
#include <condition_variable>

#include "commons.hh"

namespace beatwatch {

    //
    // Single-slot "latest wins" mailbox for StateEvents.
    //  The sender overwrites the slot and bumps a sequence number, it never waits
    //  for an observer. Each receiver remembers the last sequence it consumed, so
    //  every receiver sees every future event unless it falls behind, in which case
    //  it only gets the latest unread one.
    struct ChannelSlot {
        std::mutex                  slot_lock;
        std::condition_variable     slot_cv;

        uint64_t                    seq;        // 0 means nothing published yet.
        StateEvent                  latest;
        bool                        closed;

        ChannelSlot() : seq(0), latest(StateEvent::makeFault(FAULT_INITIAL)), closed(false) { }
    };

    class StateReceiver {
    private:
        std::shared_ptr<ChannelSlot>    slot;
        uint64_t                        seen;

    public:
        StateReceiver(std::shared_ptr<ChannelSlot>);
        ~StateReceiver() { }

        bool doTryRecv(StateEvent&);                // Non-blocking.
        int doRecv(StateEvent&, Duration);          // RETCODE_OK, RETCODE_TIMEOUT or RETCODE_CLOSED.

        bool isClosed() const;
    };

    class StateSender {
    private:
        std::shared_ptr<ChannelSlot>    slot;

    public:
        StateSender(std::shared_ptr<ChannelSlot>);
        ~StateSender() { }

        int doSend(const StateEvent&);              // Overwrites any unread event.
        void doClose();

        StateReceiver getReceiver() const;
    };

    //
    // Creates the shared slot and hands out its sending half.
    StateSender makeStateChannel();
}
