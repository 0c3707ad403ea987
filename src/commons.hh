#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cstdint>
#include <chrono>

namespace beatwatch {

    typedef std::chrono::microseconds   Duration;

    //
    // Return codes. Every fallible call in Beatwatch returns one of these.
    //  RETCODE_TIMEOUT is the expected outcome of a missed beat and is absorbed by
    //  the processor. RETCODE_IO and RETCODE_FAILED terminate a run loop.
    enum {
        RETCODE_OK          = 0,
        RETCODE_TIMEOUT,
        RETCODE_IO,
        RETCODE_FAILED,
        RETCODE_CLOSED,
        RETCODE_INVALID,
    };

    const char* strRetcode(int);
    int retcodeFromErrno(int);

    //
    // Heartbeat signal level. The byte values are what a peer puts on the wire.
    enum Edge : uint8_t {
        EDGE_RISING     = '+',
        EDGE_FALLING    = '.',
    };

    Edge flipEdge(Edge);
    Edge edgeFromByte(uint8_t);     // 1 or '+' is Rising, anything else is Falling.
    Edge edgeFromBool(bool);
    bool edgeToBool(Edge);
    const char* strEdge(Edge);

    //
    // Published watchdog state. Bit-representable, stored in an atomic bool.
    enum State : uint8_t {
        STATE_FAULT     = 0,
        STATE_OK        = 1,
    };

    State stateFromBool(bool);
    State stateFromByte(uint8_t);
    bool stateToBool(State);
    const char* strState(State);

    enum FaultKind : uint8_t {
        FAULT_INITIAL   = 0,        // Watchdog is always started in Fault.
        FAULT_TIMEOUT,              // No heartbeat received in time.
        FAULT_WINDOW,               // Heartbeat arrived before the window opened.
        FAULT_OUTOFORDER,           // Peer repeated an edge instead of alternating.
    };

    const char* strFaultKind(FaultKind);

    //
    // StateEvent is what observers receive. It keeps the reason of a fault,
    //  which State alone forgets.
    struct StateEvent {
        State       state;
        FaultKind   kind;           // Meaningful only when state is STATE_FAULT.

        static StateEvent makeOk();
        static StateEvent makeFault(FaultKind);

        bool isOk() const { return state == STATE_OK; }
        bool isFault() const { return state == STATE_FAULT; }
    };

    bool operator==(const StateEvent&, const StateEvent&);
    bool operator!=(const StateEvent&, const StateEvent&);

    //
    // Acceptance range of a beat.
    //  RANGE_TIMEOUT: any edge within the value past the expected moment is accepted.
    //  RANGE_WINDOW:  two-sided band of the value around the expected moment. Early
    //                 edges fault with FAULT_WINDOW, late ones through the I/O deadline.
    enum {
        RANGE_TIMEOUT,
        RANGE_WINDOW,
    };

    struct Range {
        int         type;
        Duration    value;

        static Range makeTimeout(Duration);
        static Range makeWindow(Duration);

        Duration getTimeout() const { return value; }
        bool isWindow() const { return type == RANGE_WINDOW; }
    };

    //
    // Outcome of a single I/O poll: retcode, and the edge when retcode is RETCODE_OK.
    struct PollResult {
        int         retcode;
        Edge        edge;
    };
}
