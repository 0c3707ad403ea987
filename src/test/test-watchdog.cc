/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <memory>
#include <thread>
#include <vector>

#include "test-helpers.hh"

static beatwatch::Logger bw_lgr("BEATWATCH-WD-TEST", "beatwatch-wd.test.log");

using namespace std::chrono;
using beatwatch::test::makeBeat;
using beatwatch::test::makeMiss;

//
// Four alternating edges on time recover exactly once. The script then runs dry,
//  which ends the loop with RETCODE_IO.
int testRecoveryScenario() {

    beatwatch::WatchdogConfig config(milliseconds(100));
    config.setWarmup(milliseconds(50));

    std::vector<beatwatch::test::ScriptStep> steps = {
        makeBeat(milliseconds(100), beatwatch::EDGE_RISING),
        makeBeat(milliseconds(100), beatwatch::EDGE_FALLING),
        makeBeat(milliseconds(100), beatwatch::EDGE_RISING),
        makeBeat(milliseconds(100), beatwatch::EDGE_FALLING)
    };

    beatwatch::test::ScriptedIo* io = new beatwatch::test::ScriptedIo(steps);
    beatwatch::Watchdog watchdog(config, std::unique_ptr<beatwatch::WatchdogIo>(io));

    beatwatch::test::EventCollector collector(watchdog.getStateRx());

    BEATWATCH_TEST_EXPECT(bw_lgr, watchdog.getState() == beatwatch::STATE_FAULT);

    int ret = watchdog.doRun();
    BEATWATCH_TEST_EXPECT(bw_lgr, ret == beatwatch::RETCODE_IO);
    BEATWATCH_TEST_EXPECT(bw_lgr, watchdog.getState() == beatwatch::STATE_OK);
    BEATWATCH_TEST_EXPECT(bw_lgr, watchdog.getStateRef().load());

    BEATWATCH_TEST_EXPECT(bw_lgr, collector.doWaitFor(beatwatch::StateEvent::makeOk(), seconds(1)));
    collector.doStop();

    std::vector<beatwatch::test::RecordedEvent> events = collector.getEvents();
    BEATWATCH_TEST_EXPECT(bw_lgr, events.size() == 2);
    BEATWATCH_TEST_EXPECT(bw_lgr, events[0].event == beatwatch::StateEvent::makeFault(beatwatch::FAULT_INITIAL));
    BEATWATCH_TEST_EXPECT(bw_lgr, events[1].event.isOk());

    // Only the initial warm-up cleared the backend.
    BEATWATCH_TEST_EXPECT(bw_lgr, io->clears.load() == 1);
    BEATWATCH_TEST_EXPECT(bw_lgr, io->gets.load() == 5);

    BEATWATCH_LOGGER_INFO(bw_lgr, "Recovery scenario: {} events.", events.size());
    return 0;
}

//
// Every timeout is published and warms up again, even when already faulty.
int testRepeatedFaults() {

    beatwatch::WatchdogConfig config(milliseconds(100));
    config.setWarmup(milliseconds(50));

    std::vector<beatwatch::test::ScriptStep> steps = {
        makeMiss(milliseconds(10)),
        makeMiss(milliseconds(10)),
        makeMiss(milliseconds(10))
    };

    beatwatch::test::ScriptedIo* io = new beatwatch::test::ScriptedIo(steps);
    beatwatch::Watchdog watchdog(config, std::unique_ptr<beatwatch::WatchdogIo>(io));

    beatwatch::test::EventCollector collector(watchdog.getStateRx());

    steady_clock::time_point begin = steady_clock::now();
    int ret = watchdog.doRun();

    BEATWATCH_TEST_EXPECT(bw_lgr, ret == beatwatch::RETCODE_IO);
    BEATWATCH_TEST_EXPECT(bw_lgr, watchdog.getState() == beatwatch::STATE_FAULT);

    // Initial, then three timeouts: four warm-ups.
    BEATWATCH_TEST_EXPECT(bw_lgr, io->clears.load() == 4);
    BEATWATCH_TEST_EXPECT(bw_lgr, steady_clock::now() - begin >= milliseconds(200));

    BEATWATCH_TEST_EXPECT(bw_lgr,
        collector.doWaitFor(beatwatch::StateEvent::makeFault(beatwatch::FAULT_TIMEOUT), seconds(1)));
    collector.doStop();

    BEATWATCH_TEST_EXPECT(bw_lgr, collector.countOf(beatwatch::StateEvent::makeOk()) == 0);

    return 0;
}

int testWindowFault() {

    beatwatch::WatchdogConfig config(milliseconds(100));
    config.setRange(beatwatch::Range::makeWindow(milliseconds(10)));
    config.setWarmup(milliseconds(20));

    // The third beat comes in a third of the interval.
    std::vector<beatwatch::test::ScriptStep> steps = {
        makeBeat(milliseconds(100), beatwatch::EDGE_RISING),
        makeBeat(milliseconds(100), beatwatch::EDGE_FALLING),
        makeBeat(milliseconds(30), beatwatch::EDGE_RISING)
    };

    beatwatch::test::ScriptedIo* io = new beatwatch::test::ScriptedIo(steps);
    beatwatch::Watchdog watchdog(config, std::unique_ptr<beatwatch::WatchdogIo>(io));

    beatwatch::test::EventCollector collector(watchdog.getStateRx());

    int ret = watchdog.doRun();
    BEATWATCH_TEST_EXPECT(bw_lgr, ret == beatwatch::RETCODE_IO);

    BEATWATCH_TEST_EXPECT(bw_lgr,
        collector.doWaitFor(beatwatch::StateEvent::makeFault(beatwatch::FAULT_WINDOW), seconds(1)));
    collector.doStop();

    BEATWATCH_TEST_EXPECT(bw_lgr, collector.countOf(beatwatch::StateEvent::makeOk()) == 0);
    BEATWATCH_TEST_EXPECT(bw_lgr, io->clears.load() == 2);

    return 0;
}

int testOutOfOrderAfterOk() {

    beatwatch::WatchdogConfig config(milliseconds(20));
    config.setWarmup(milliseconds(20));

    std::vector<beatwatch::test::ScriptStep> steps = {
        makeBeat(milliseconds(5), beatwatch::EDGE_RISING),
        makeBeat(milliseconds(5), beatwatch::EDGE_FALLING),
        makeBeat(milliseconds(5), beatwatch::EDGE_RISING),
        makeBeat(milliseconds(5), beatwatch::EDGE_FALLING),
        makeBeat(milliseconds(5), beatwatch::EDGE_FALLING)
    };

    beatwatch::test::ScriptedIo* io = new beatwatch::test::ScriptedIo(steps);
    beatwatch::Watchdog watchdog(config, std::unique_ptr<beatwatch::WatchdogIo>(io));

    beatwatch::test::EventCollector collector(watchdog.getStateRx());

    int ret = watchdog.doRun();
    BEATWATCH_TEST_EXPECT(bw_lgr, ret == beatwatch::RETCODE_IO);
    BEATWATCH_TEST_EXPECT(bw_lgr, watchdog.getState() == beatwatch::STATE_FAULT);

    BEATWATCH_TEST_EXPECT(bw_lgr,
        collector.doWaitFor(beatwatch::StateEvent::makeFault(beatwatch::FAULT_OUTOFORDER), seconds(1)));
    collector.doStop();

    BEATWATCH_TEST_EXPECT(bw_lgr, io->clears.load() == 2);

    return 0;
}

//
// doStop() interrupts a warm-up right away, and no clear follows.
int testStopDuringWarmup() {

    beatwatch::WatchdogConfig config(milliseconds(100));
    config.setWarmup(seconds(10));

    std::vector<beatwatch::test::ScriptStep> steps;

    beatwatch::test::ScriptedIo* io = new beatwatch::test::ScriptedIo(steps);
    beatwatch::Watchdog watchdog(config, std::unique_ptr<beatwatch::WatchdogIo>(io));

    int ret = beatwatch::RETCODE_FAILED;
    steady_clock::time_point begin = steady_clock::now();

    std::thread runner([&watchdog, &ret]() { ret = watchdog.doRun(); });

    std::this_thread::sleep_for(milliseconds(50));
    watchdog.doStop();
    runner.join();

    BEATWATCH_TEST_EXPECT(bw_lgr, ret == beatwatch::RETCODE_OK);
    BEATWATCH_TEST_EXPECT(bw_lgr, steady_clock::now() - begin < seconds(5));
    BEATWATCH_TEST_EXPECT(bw_lgr, io->clears.load() == 0);
    BEATWATCH_TEST_EXPECT(bw_lgr, io->gets.load() == 0);

    return 0;
}

//
// A second run while running is refused, and a stopped watchdog runs again.
int testRunAgainAfterStop() {

    beatwatch::WatchdogConfig config(milliseconds(100));
    config.setWarmup(milliseconds(20));

    std::vector<beatwatch::test::ScriptStep> steps;
    for (int miss = 0; miss < 40; miss++)
        steps.push_back(beatwatch::test::makeMiss(milliseconds(30)));

    beatwatch::test::ScriptedIo* io = new beatwatch::test::ScriptedIo(steps);
    beatwatch::Watchdog watchdog(config, std::unique_ptr<beatwatch::WatchdogIo>(io));

    int ret = beatwatch::RETCODE_FAILED;
    std::thread runner([&watchdog, &ret]() { ret = watchdog.doRun(); });

    std::this_thread::sleep_for(milliseconds(60));
    BEATWATCH_TEST_EXPECT(bw_lgr, watchdog.isRunning());
    BEATWATCH_TEST_EXPECT(bw_lgr, watchdog.doRun() == beatwatch::RETCODE_FAILED);

    watchdog.doStop();
    runner.join();

    BEATWATCH_TEST_EXPECT(bw_lgr, ret == beatwatch::RETCODE_OK);
    BEATWATCH_TEST_EXPECT(bw_lgr, !watchdog.isRunning());

    int first_gets = io->gets.load();

    // The earlier stop does not end this run.
    ret = beatwatch::RETCODE_FAILED;
    std::thread rerunner([&watchdog, &ret]() { ret = watchdog.doRun(); });

    std::this_thread::sleep_for(milliseconds(100));
    BEATWATCH_TEST_EXPECT(bw_lgr, watchdog.isRunning());

    watchdog.doStop();
    rerunner.join();

    BEATWATCH_TEST_EXPECT(bw_lgr, ret == beatwatch::RETCODE_OK);
    BEATWATCH_TEST_EXPECT(bw_lgr, io->gets.load() > first_gets);

    return 0;
}

int testInvalidConfig() {

    std::vector<beatwatch::test::ScriptStep> steps;

    beatwatch::WatchdogConfig zero_interval(milliseconds(0));
    beatwatch::Watchdog wd_a(zero_interval,
        std::unique_ptr<beatwatch::WatchdogIo>(new beatwatch::test::ScriptedIo(steps)));

    BEATWATCH_TEST_EXPECT(bw_lgr, wd_a.doRun() == beatwatch::RETCODE_INVALID);

    beatwatch::WatchdogConfig zero_beats(milliseconds(100));
    zero_beats.setMinBeats(0);
    beatwatch::Watchdog wd_b(zero_beats,
        std::unique_ptr<beatwatch::WatchdogIo>(new beatwatch::test::ScriptedIo(steps)));

    BEATWATCH_TEST_EXPECT(bw_lgr, wd_b.doRun() == beatwatch::RETCODE_INVALID);

    // min_beats x 2 would wrap.
    beatwatch::WatchdogConfig huge_beats(milliseconds(100));
    huge_beats.setMinBeats(beatwatch::MAX_MIN_BEATS + 1);
    beatwatch::Watchdog wd_huge(huge_beats,
        std::unique_ptr<beatwatch::WatchdogIo>(new beatwatch::test::ScriptedIo(steps)));

    BEATWATCH_TEST_EXPECT(bw_lgr, wd_huge.doRun() == beatwatch::RETCODE_INVALID);
    BEATWATCH_TEST_EXPECT(bw_lgr, !wd_huge.isRunning());

    beatwatch::Watchdog wd_c(beatwatch::WatchdogConfig(milliseconds(100)), std::unique_ptr<beatwatch::WatchdogIo>(nullptr));
    BEATWATCH_TEST_EXPECT(bw_lgr, wd_c.doRun() == beatwatch::RETCODE_FAILED);

    return 0;
}

//
// A heart on a local line: Ok while it beats, Timeout once it stops, Ok again
//  once it resumes.
int testLocalLineScenario() {

    beatwatch::LocalLine line;
    beatwatch::LocalLineHeart heart(line);
    beatwatch::HeartRunner runner(heart, milliseconds(20));

    beatwatch::WatchdogConfig config(milliseconds(20));
    config.setRange(beatwatch::Range::makeTimeout(milliseconds(20)));
    config.setWarmup(milliseconds(40));

    beatwatch::Watchdog watchdog(config, std::unique_ptr<beatwatch::WatchdogIo>(
        new beatwatch::LocalLineIo(line, config.getIoTimeout(), milliseconds(1))));

    beatwatch::test::EventCollector collector(watchdog.getStateRx());

    int ret = beatwatch::RETCODE_FAILED;
    std::thread wd_runner([&watchdog, &ret]() { ret = watchdog.doRun(); });

    runner.doLaunchRunner();
    BEATWATCH_TEST_EXPECT(bw_lgr, collector.doWaitFor(beatwatch::StateEvent::makeOk(), seconds(3)));
    BEATWATCH_TEST_EXPECT(bw_lgr, watchdog.getState() == beatwatch::STATE_OK);

    runner.doKillRunner();
    BEATWATCH_TEST_EXPECT(bw_lgr,
        collector.doWaitFor(beatwatch::StateEvent::makeFault(beatwatch::FAULT_TIMEOUT), seconds(3)));
    BEATWATCH_TEST_EXPECT(bw_lgr, watchdog.getState() == beatwatch::STATE_FAULT);

    size_t oks = collector.countOf(beatwatch::StateEvent::makeOk());

    runner.doLaunchRunner();

    steady_clock::time_point deadline = steady_clock::now() + seconds(3);
    while ((collector.countOf(beatwatch::StateEvent::makeOk()) == oks) && (steady_clock::now() < deadline))
        std::this_thread::sleep_for(milliseconds(5));

    BEATWATCH_TEST_EXPECT(bw_lgr, collector.countOf(beatwatch::StateEvent::makeOk()) > oks);
    BEATWATCH_LOGGER_INFO(bw_lgr, "Local line: {} beats sent.", runner.doPeek());

    runner.doKillRunner();
    watchdog.doStop();
    wd_runner.join();
    collector.doStop();

    BEATWATCH_TEST_EXPECT(bw_lgr, ret == beatwatch::RETCODE_OK);

    return 0;
}

//
// main()
int main() {

    BEATWATCH_LOGGER_INFO(bw_lgr, "Beatwatch watchdog test run.");

    if (testRecoveryScenario() != 0) return -1;
    if (testRepeatedFaults() != 0) return -1;
    if (testWindowFault() != 0) return -1;
    if (testOutOfOrderAfterOk() != 0) return -1;
    if (testStopDuringWarmup() != 0) return -1;
    if (testRunAgainAfterStop() != 0) return -1;
    if (testInvalidConfig() != 0) return -1;
    if (testLocalLineScenario() != 0) return -1;

    BEATWATCH_LOGGER_INFO(bw_lgr, "Beatwatch watchdog test end.");
    return 0;
}
