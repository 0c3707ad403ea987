#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <functional>

#include "commons.hh"

namespace beatwatch {

    //
    // Blocking I/O backend of a watchdog.
    //  doGet() blocks until the transport yields an edge or the I/O deadline passes.
    //  The expected edge lets a level-type source (a digital line) wait for a change.
    //  On the deadline it must return RETCODE_TIMEOUT, never a generic failure.
    //  doClear() discards buffered input so that the next doGet() sees fresh data.
    //
    // A backend is driven by a single run loop only, it is never called concurrently.
    class WatchdogIo {
    public:
        virtual ~WatchdogIo() { }

        virtual int doGet(Edge, Edge&) = 0;
        virtual int doClear() = 0;
    };

    //
    // Cooperative form of WatchdogIo, for a watchdog running on an event loop.
    //  The completion handler is invoked exactly once, from the event loop thread,
    //  never from inside doAsyncGet()/doAsyncClear() itself.
    typedef std::function<void(int, Edge)>  GetHandler;
    typedef std::function<void(int)>        ClearHandler;

    class WatchdogIoAsync {
    public:
        virtual ~WatchdogIoAsync() { }

        virtual void doAsyncGet(Edge, GetHandler) = 0;
        virtual void doAsyncClear(ClearHandler) = 0;
    };

    //
    // Heartbeat client: every doBeat() sends the next edge, Rising first,
    //  then alternating.
    class Heart {
    public:
        virtual ~Heart() { }

        virtual int doBeat() = 0;
    };
}
