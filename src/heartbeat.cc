/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <string>
#include <thread>

#include "logger.hh"
#include "heartbeat.hh"

namespace beatwatch {
    static Logger HEARTBEAT_LOGGER("BEATWATCH/HB", "beatwatch_hb.log");
    static std::atomic<int> RUNNER_SEQ(0);
}

/* HeartRunner */
beatwatch::HeartRunner::HeartRunner(Heart& arg_heart, Duration arg_itvl) :
    interval(arg_itvl), heart(arg_heart), beats(0), alive(false), last_ret(RETCODE_OK), runner_handle(0) { }

beatwatch::HeartRunner::~HeartRunner() { doKillRunner(); }

// HeartRunner launches a thread that beats the heart every interval, until it
//  is killed or a beat fails. A failed beat is kept in last_ret and ends the thread:
//  the peer watchdog will notice the silence.
// The interval is set using the constructor, which is unchangable.

void beatwatch::HeartRunner::doLaunchRunner() {

    if (alive.exchange(true))
        return;

    if (runner.joinable())          // A runner that exited on a failed beat.
        runner.join();

    int runner_id = RUNNER_SEQ.fetch_add(1);

    std::thread local_runner(
        [](Heart& arg_heart, Duration arg_itvl, std::atomic<uint64_t>& arg_beats,
            std::atomic<bool>& arg_alive, std::atomic<int>& arg_ret, const int arg_id) {

            std::string log_fname = "beatwatch_hb_runner_" + std::to_string(arg_id) + ".log";
            std::string logger_name = "BEATWATCH/HB/R" + std::to_string(arg_id);
            LoggerFileOnly runner_logger(logger_name, log_fname);

            BEATWATCH_LOGGER_INFO(runner_logger, "Runner started, interval {} us, {} beats so far.",
                arg_itvl.count(), arg_beats.load());

            std::chrono::steady_clock::time_point next_beat = std::chrono::steady_clock::now();

            while (arg_alive.load()) {

                int ret = arg_heart.doBeat();
                if (ret != RETCODE_OK) {
                    arg_ret.store(ret);
                    arg_alive.store(false);
                    BEATWATCH_LOGGER_ERROR(HEARTBEAT_LOGGER, "Beat failed ({}), runner exits.", strRetcode(ret));
                    BEATWATCH_LOGGER_INFO(runner_logger, "Beat failed: {}", strRetcode(ret));
                    break;
                }

                arg_beats.fetch_add(1);

                // Scheduled on absolute instants, so the beat period does not drift.
                next_beat += arg_itvl;
                std::this_thread::sleep_until(next_beat);
            }

            BEATWATCH_LOGGER_INFO(runner_logger, "Runner exits, {} beats sent.", arg_beats.load());
        },
        std::ref(heart), interval, std::ref(beats), std::ref(alive), std::ref(last_ret), runner_id
    );

    runner = std::move(local_runner);
    runner_handle = runner.native_handle();

    BEATWATCH_LOGGER_DEBUG(HEARTBEAT_LOGGER, "HeartRunner launched: Handle {}", runner_handle);
}

// This doKillRunner stops the beating thread and waits for it.
// Even after the kill, another new beating thread can be launched by
//  calling again the doLaunchRunner.

void beatwatch::HeartRunner::doKillRunner() {

    alive.store(false);

    if (runner.joinable()) {
        BEATWATCH_LOGGER_DEBUG(HEARTBEAT_LOGGER, "HeartRunner killing: Handle {}", runner_handle);
        runner.join();
    }
}

uint64_t beatwatch::HeartRunner::doPeek() const {
    return beats.load();
}

int beatwatch::HeartRunner::getLastRet() const { return last_ret.load(); }
bool beatwatch::HeartRunner::isAlive() const { return alive.load(); }
