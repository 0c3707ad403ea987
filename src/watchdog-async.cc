/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include "logger.hh"
#include "watchdog-async.hh"

namespace beatwatch {
    static Logger WATCHDOG_ASYNC_LOGGER("BEATWATCH/WD-ASYNC", "beatwatch_wd_async.log");
}

beatwatch::WatchdogAsync::WatchdogAsync(
        boost::asio::io_context& arg_io_ctx, const WatchdogConfig& arg_config, std::unique_ptr<WatchdogIoAsync> arg_io
    ) : io_ctx(arg_io_ctx), warmup_timer(arg_io_ctx), config(arg_config), io(std::move(arg_io)),
        state(false), state_tx(makeStateChannel()), stop_requested(false), running(false) { }

beatwatch::WatchdogAsync::~WatchdogAsync() {
    state_tx.doClose();
}



/// @brief Schedules the watchdog loop on the io_context. Nothing runs until the
///  io_context is run. arg_handler is called once, with RETCODE_OK after doStop()
///  or with the fatal retcode that ended the loop.
/// @param arg_handler
/// @return RETCODE_OK if scheduled.
int beatwatch::WatchdogAsync::doRun(RunHandler arg_handler) {

    if (!config.isValid()) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_ASYNC_LOGGER, "Invalid configuration (interval {} us, min beats {}).",
            config.getInterval().count(), config.getMinBeats());
        return RETCODE_INVALID;
    }

    if (io == nullptr) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_ASYNC_LOGGER, "No I/O backend.");
        return RETCODE_FAILED;
    }

    if (running.exchange(true)) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_ASYNC_LOGGER, "Watchdog is already running.");
        return RETCODE_FAILED;
    }

    run_handler = arg_handler;

    boost::asio::post(io_ctx, [this]() {

        BEATWATCH_LOGGER_INFO(WATCHDOG_ASYNC_LOGGER, "Watchdog started: interval {} us, I/O timeout {} us, {} range.",
            config.getInterval().count(), config.getIoTimeout().count(),
            config.getRange().isWindow() ? "window" : "timeout");

        __setFault(FAULT_INITIAL, [this]() {
            processor.reset(new WatchdogProcessor(config));
            __poll();
        });
    });

    return RETCODE_OK;
}

void beatwatch::WatchdogAsync::doStop() {

    stop_requested.store(true);

    // The timer belongs to the io_context thread.
    boost::asio::post(io_ctx, [this]() { warmup_timer.cancel(); });
}



void beatwatch::WatchdogAsync::__poll() {

    if (stop_requested.load()) {
        __finish(RETCODE_OK);
        return;
    }

    io->doAsyncGet(processor->getNext(), [this](int arg_ret, Edge arg_edge) {
        __onPolled(arg_ret, arg_edge);
    });
}

void beatwatch::WatchdogAsync::__onPolled(int arg_ret, Edge arg_edge) {

    PollResult poll;
    poll.retcode = arg_ret;
    poll.edge = arg_edge;

    StateEvent event;
    bool emitted = false;

    int ret = processor->doProcess(poll, getState(), event, emitted);
    if (ret != RETCODE_OK) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_ASYNC_LOGGER, "I/O failed ({}), watchdog terminated.", strRetcode(ret));
        __finish(ret);
        return;
    }

    if (!emitted) {
        __poll();
        return;
    }

    if (event.isOk()) {
        ret = __setOk();
        if (ret != RETCODE_OK) {
            __finish(ret);
            return;
        }

        __poll();
        return;
    }

    __setFault(event.kind, [this]() { __poll(); });
}



int beatwatch::WatchdogAsync::__setOk() {

    if (getState() == STATE_OK)
        return RETCODE_OK;

    state.store(true, std::memory_order_relaxed);
    BEATWATCH_LOGGER_INFO(WATCHDOG_ASYNC_LOGGER, "State OK.");

    if (state_tx.doSend(StateEvent::makeOk()) != RETCODE_OK) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_ASYNC_LOGGER, "State channel closed.");
        return RETCODE_FAILED;
    }

    return RETCODE_OK;
}



/// @brief Publishes a fault, warms up, then continues with arg_next.
///  Repeated faults are published and warmed up again, as in Watchdog.
/// @param arg_kind
/// @param arg_next
void beatwatch::WatchdogAsync::__setFault(FaultKind arg_kind, std::function<void()> arg_next) {

    if (getState() == STATE_OK)
        BEATWATCH_LOGGER_WARN(WATCHDOG_ASYNC_LOGGER, "State FAULT ({}).", strFaultKind(arg_kind));
    else
        BEATWATCH_LOGGER_DEBUG(WATCHDOG_ASYNC_LOGGER, "State FAULT ({}), already faulty.", strFaultKind(arg_kind));

    state.store(false, std::memory_order_relaxed);

    if (state_tx.doSend(StateEvent::makeFault(arg_kind)) != RETCODE_OK) {
        BEATWATCH_LOGGER_ERROR(WATCHDOG_ASYNC_LOGGER, "State channel closed.");
        __finish(RETCODE_FAILED);
        return;
    }

    __warmup(arg_next);
}

void beatwatch::WatchdogAsync::__warmup(std::function<void()> arg_next) {

    BEATWATCH_LOGGER_DEBUG(WATCHDOG_ASYNC_LOGGER, "Warming up for {} us.", config.getWarmup().count());

    if (stop_requested.load()) {
        __finish(RETCODE_OK);
        return;
    }

    warmup_timer.expires_after(config.getWarmup());
    warmup_timer.async_wait([this, arg_next](const boost::system::error_code& arg_ec) {

        // Cancelled only by doStop().
        if (stop_requested.load() || arg_ec == boost::asio::error::operation_aborted) {
            __finish(RETCODE_OK);
            return;
        }

        io->doAsyncClear([this, arg_next](int arg_ret) {

            if (arg_ret != RETCODE_OK) {
                BEATWATCH_LOGGER_ERROR(WATCHDOG_ASYNC_LOGGER, "Failed to clear the I/O ({}).", strRetcode(arg_ret));
                __finish(arg_ret);
                return;
            }

            arg_next();
        });
    });
}



void beatwatch::WatchdogAsync::__finish(int arg_ret) {

    processor.reset();

    // A pending stop ends with this run.
    stop_requested.store(false);
    running.store(false);

    if (arg_ret == RETCODE_OK)
        BEATWATCH_LOGGER_INFO(WATCHDOG_ASYNC_LOGGER, "Watchdog stopped.");

    RunHandler handler;
    handler.swap(run_handler);

    if (handler)
        handler(arg_ret);
}

beatwatch::State beatwatch::WatchdogAsync::getState() const { return stateFromBool(state.load(std::memory_order_relaxed)); }
const std::atomic<bool>& beatwatch::WatchdogAsync::getStateRef() const { return state; }
beatwatch::StateReceiver beatwatch::WatchdogAsync::getStateRx() const { return state_tx.getReceiver(); }
bool beatwatch::WatchdogAsync::isRunning() const { return running.load(); }
