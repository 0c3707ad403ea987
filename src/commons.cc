/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cerrno>

#include "commons.hh"

const char* beatwatch::strRetcode(int arg_ret) {
    switch (arg_ret) {
        case RETCODE_OK:        return "OK";
        case RETCODE_TIMEOUT:   return "TIMEOUT";
        case RETCODE_IO:        return "IO";
        case RETCODE_FAILED:    return "FAILED";
        case RETCODE_CLOSED:    return "CLOSED";
        case RETCODE_INVALID:   return "INVALID";
        default:
            break;
    }
    return "UNKNOWN";
}



/// @brief Maps an errno of a failed receive. Would-block and timed-out errnos
///  are both the expiry of a receive timeout, everything else is a transport failure.
/// @param arg_errno
/// @return
int beatwatch::retcodeFromErrno(int arg_errno) {

    if (arg_errno == EAGAIN || arg_errno == EWOULDBLOCK || arg_errno == ETIMEDOUT)
        return RETCODE_TIMEOUT;

    return RETCODE_IO;
}



beatwatch::Edge beatwatch::flipEdge(Edge arg_edge) {
    return (arg_edge == EDGE_RISING) ? EDGE_FALLING : EDGE_RISING;
}

beatwatch::Edge beatwatch::edgeFromByte(uint8_t arg_byte) {
    return (arg_byte == 1 || arg_byte == '+') ? EDGE_RISING : EDGE_FALLING;
}

beatwatch::Edge beatwatch::edgeFromBool(bool arg_level) { return arg_level ? EDGE_RISING : EDGE_FALLING; }
bool beatwatch::edgeToBool(Edge arg_edge) { return arg_edge == EDGE_RISING; }

const char* beatwatch::strEdge(Edge arg_edge) {
    return (arg_edge == EDGE_RISING) ? "Rising" : "Falling";
}



beatwatch::State beatwatch::stateFromBool(bool arg_ok) { return arg_ok ? STATE_OK : STATE_FAULT; }
beatwatch::State beatwatch::stateFromByte(uint8_t arg_byte) { return (arg_byte == 0) ? STATE_FAULT : STATE_OK; }
bool beatwatch::stateToBool(State arg_state) { return arg_state == STATE_OK; }

const char* beatwatch::strState(State arg_state) {
    return (arg_state == STATE_OK) ? "OK" : "FAULT";
}

const char* beatwatch::strFaultKind(FaultKind arg_kind) {
    switch (arg_kind) {
        case FAULT_INITIAL:     return "Initial";
        case FAULT_TIMEOUT:     return "Timeout";
        case FAULT_WINDOW:      return "Window";
        case FAULT_OUTOFORDER:  return "OutOfOrder";
        default:
            break;
    }
    return "Unknown";
}



beatwatch::StateEvent beatwatch::StateEvent::makeOk() {
    StateEvent event;
    event.state = STATE_OK;
    event.kind  = FAULT_INITIAL;

    return event;
}

beatwatch::StateEvent beatwatch::StateEvent::makeFault(FaultKind arg_kind) {
    StateEvent event;
    event.state = STATE_FAULT;
    event.kind  = arg_kind;

    return event;
}

//
// Two Ok events are equal regardless of the (unused) kind field.
bool beatwatch::operator==(const StateEvent& arg_a, const StateEvent& arg_b) {
    if (arg_a.state != arg_b.state)
        return false;

    return (arg_a.state == STATE_OK) || (arg_a.kind == arg_b.kind);
}

bool beatwatch::operator!=(const StateEvent& arg_a, const StateEvent& arg_b) { return !(arg_a == arg_b); }



beatwatch::Range beatwatch::Range::makeTimeout(Duration arg_value) {
    Range range;
    range.type  = RANGE_TIMEOUT;
    range.value = arg_value;

    return range;
}

beatwatch::Range beatwatch::Range::makeWindow(Duration arg_value) {
    Range range;
    range.type  = RANGE_WINDOW;
    range.value = arg_value;

    return range;
}
