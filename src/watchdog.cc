/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include "logger.hh"
#include "watchdog.hh"
#include "processor.hh"

namespace beatwatch {
    static Logger WATCHDOG_LOGGER("BEATWATCH/WD", "beatwatch_wd.log");
}

//
// A watchdog always starts in Fault. There is no unknown state.
beatwatch::Watchdog::Watchdog(const WatchdogConfig& arg_config, std::unique_ptr<WatchdogIo> arg_io) :
    config(arg_config), io(std::move(arg_io)), state(false), state_tx(makeStateChannel()),
    stop_requested(false), running(false) { }

beatwatch::Watchdog::~Watchdog() {
    state_tx.doClose();     // Wakes up receivers blocked in doRecv().
}



/// @brief Runs the poll/process/publish loop on the calling thread.
///  Only one thread may run it at a time. A pending stop is consumed when the
///  run returns, so a stopped watchdog can be run again.
/// @return RETCODE_OK when stopped, RETCODE_FAILED if already running,
///  otherwise the fatal retcode that ended the loop.
int beatwatch::Watchdog::doRun() {

    if (running.exchange(true)) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_LOGGER, "Watchdog is already running.");
        return RETCODE_FAILED;
    }

    int ret = __run();

    stop_requested.store(false);
    running.store(false);

    return ret;
}



int beatwatch::Watchdog::__run() {

    if (!config.isValid()) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_LOGGER, "Invalid configuration (interval {} us, min beats {}).",
            config.getInterval().count(), config.getMinBeats());
        return RETCODE_INVALID;
    }

    if (io == nullptr) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_LOGGER, "No I/O backend.");
        return RETCODE_FAILED;
    }

    BEATWATCH_LOGGER_INFO(WATCHDOG_LOGGER, "Watchdog started: interval {} us, I/O timeout {} us, {} range.",
        config.getInterval().count(), config.getIoTimeout().count(),
        config.getRange().isWindow() ? "window" : "timeout");

    //
    // Subscribers must always observe the Initial reason, even though the
    //  state already reads Fault.
    int ret = __setFault(FAULT_INITIAL);
    if (ret != RETCODE_OK)
        return ret;

    WatchdogProcessor processor(config);

    PollResult poll;
    StateEvent event;
    bool emitted;

    while (!stop_requested.load()) {

        poll.edge = processor.getNext();
        poll.retcode = io->doGet(processor.getNext(), poll.edge);

        ret = processor.doProcess(poll, getState(), event, emitted);
        if (ret != RETCODE_OK) {
            BEATWATCH_LOGGER_ERROR(WATCHDOG_LOGGER, "I/O failed ({}), watchdog terminated.", strRetcode(ret));
            return ret;
        }

        if (!emitted)
            continue;

        if (event.isOk())
            ret = __setOk();
        else
            ret = __setFault(event.kind);

        if (ret != RETCODE_OK)
            return ret;
    }

    BEATWATCH_LOGGER_INFO(WATCHDOG_LOGGER, "Watchdog stopped.");
    return RETCODE_OK;
}

void beatwatch::Watchdog::doStop() {

    {
        std::lock_guard<std::mutex> guard(stop_lock);
        stop_requested.store(true);
    }

    stop_cv.notify_all();
}



int beatwatch::Watchdog::__setOk() {

    if (getState() == STATE_OK)
        return RETCODE_OK;

    state.store(true, std::memory_order_relaxed);
    BEATWATCH_LOGGER_INFO(WATCHDOG_LOGGER, "State OK.");

    if (state_tx.doSend(StateEvent::makeOk()) != RETCODE_OK) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_LOGGER, "State channel closed.");
        return RETCODE_FAILED;
    }

    return RETCODE_OK;
}



/// @brief Publishes a fault and warms up.
///  A repeated fault (state already Fault) is published again with its new
///  reason and warms up again. The bool representation does not change.
/// @param arg_kind
/// @return
int beatwatch::Watchdog::__setFault(FaultKind arg_kind) {

    if (getState() == STATE_OK)
        BEATWATCH_LOGGER_WARN(WATCHDOG_LOGGER, "State FAULT ({}).", strFaultKind(arg_kind));
    else
        BEATWATCH_LOGGER_DEBUG(WATCHDOG_LOGGER, "State FAULT ({}), already faulty.", strFaultKind(arg_kind));

    state.store(false, std::memory_order_relaxed);

    if (state_tx.doSend(StateEvent::makeFault(arg_kind)) != RETCODE_OK) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_LOGGER, "State channel closed.");
        return RETCODE_FAILED;
    }

    return __warmup();
}



int beatwatch::Watchdog::__warmup() {

    BEATWATCH_LOGGER_DEBUG(WATCHDOG_LOGGER, "Warming up for {} us.", config.getWarmup().count());

    {
        std::unique_lock<std::mutex> lock(stop_lock);
        stop_cv.wait_for(lock, config.getWarmup(), [this]() { return stop_requested.load(); });
    }

    if (stop_requested.load())
        return RETCODE_OK;

    int ret = io->doClear();
    if (ret != RETCODE_OK)
        BEATWATCH_LOGGER_ERROR(WATCHDOG_LOGGER, "Failed to clear the I/O ({}).", strRetcode(ret));

    return ret;
}

beatwatch::State beatwatch::Watchdog::getState() const { return stateFromBool(state.load(std::memory_order_relaxed)); }
const std::atomic<bool>& beatwatch::Watchdog::getStateRef() const { return state; }
beatwatch::StateReceiver beatwatch::Watchdog::getStateRx() const { return state_tx.getReceiver(); }
const beatwatch::WatchdogConfig& beatwatch::Watchdog::getConfig() const { return config; }
bool beatwatch::Watchdog::isRunning() const { return running.load(); }
