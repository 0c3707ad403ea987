/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include "processor.hh"

beatwatch::WatchdogProcessor::WatchdogProcessor(const WatchdogConfig& arg_config) :
    config(arg_config), packets(0), next(EDGE_RISING), last_poll(std::chrono::steady_clock::now()) { }

beatwatch::WatchdogProcessor::WatchdogProcessor(const WatchdogConfig& arg_config, TimePoint arg_start) :
    config(arg_config), packets(0), next(EDGE_RISING), last_poll(arg_start) { }

int beatwatch::WatchdogProcessor::doProcess(
        const PollResult& arg_poll, State arg_current, StateEvent& arg_event, bool& arg_emitted) {
    return doProcess(arg_poll, arg_current, arg_event, arg_emitted, std::chrono::steady_clock::now());
}



/// @brief Classifies one poll outcome. At most one event is emitted per call.
/// @param arg_poll     Outcome of the I/O poll.
/// @param arg_current  Currently published state.
/// @param arg_event    Set when arg_emitted is true.
/// @param arg_emitted  Whether the published state has to be updated.
/// @param arg_now      Instant of this call.
/// @return RETCODE_OK, or the fatal retcode of the poll, forwarded unchanged.
int beatwatch::WatchdogProcessor::doProcess(
        const PollResult& arg_poll, State arg_current, StateEvent& arg_event, bool& arg_emitted,
        TimePoint arg_now
    ) {

    Duration elapsed = std::chrono::duration_cast<Duration>(arg_now - last_poll);
    last_poll = arg_now;

    arg_emitted = false;

    if (arg_poll.retcode == RETCODE_TIMEOUT) {
        packets = 0;

        arg_event = StateEvent::makeFault(FAULT_TIMEOUT);
        arg_emitted = true;

        return RETCODE_OK;
    }

    if (arg_poll.retcode != RETCODE_OK)
        return arg_poll.retcode;

    //
    // Too early. The raw elapsed time is compared, whichever edge was expected.
    if (config.getRange().isWindow() && (elapsed < config.getEarliestBeat())) {
        packets = 0;

        arg_event = StateEvent::makeFault(FAULT_WINDOW);
        arg_emitted = true;

        return RETCODE_OK;
    }

    if (arg_poll.edge == next) {
        next = flipEdge(next);

        if (arg_current == STATE_FAULT) {
            packets++;

            if (static_cast<uint64_t>(packets) >= static_cast<uint64_t>(config.getMinBeats()) * 2) {
                arg_event = StateEvent::makeOk();
                arg_emitted = true;
            }
        }

        return RETCODE_OK;
    }

    //
    // Repeated edge. A single stray one right after a reset is tolerated.
    if (packets > 1) {
        packets = 0;

        arg_event = StateEvent::makeFault(FAULT_OUTOFORDER);
        arg_emitted = true;
    }

    return RETCODE_OK;
}

beatwatch::Edge beatwatch::WatchdogProcessor::getNext() const { return next; }
uint32_t beatwatch::WatchdogProcessor::getPackets() const { return packets; }
