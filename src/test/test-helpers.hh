#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/post.hpp>

#include "../beatwatch.hh"

//
// Test check. Logs the failed expression and leaves the calling test function with -1.
#define BEATWATCH_TEST_EXPECT(LGR, COND) \
    do { \
        if (!(COND)) { \
            BEATWATCH_LOGGER_ERROR((LGR), "Failed: {} ({}:{})", #COND, __FILE__, __LINE__); \
            return -1; \
        } \
    } while(0)

namespace beatwatch {

    namespace test {

        typedef std::chrono::steady_clock   Clock;

        struct ScriptStep {
            Duration    delay;          // How long the poll blocks.
            int         retcode;
            Edge        edge;
        };

        inline ScriptStep makeBeat(std::chrono::milliseconds arg_delay, Edge arg_edge) {
            ScriptStep step = { arg_delay, RETCODE_OK, arg_edge };
            return step;
        }

        inline ScriptStep makeMiss(std::chrono::milliseconds arg_delay) {
            ScriptStep step = { arg_delay, RETCODE_TIMEOUT, EDGE_FALLING };
            return step;
        }

        //
        // Blocking backend replaying a script of poll outcomes.
        // Once the script is exhausted every poll fails with RETCODE_IO,
        //  which ends the run loop.
        class ScriptedIo : public WatchdogIo {
        private:
            std::vector<ScriptStep>     steps;
            size_t                      cursor;

        public:
            std::atomic<int>            gets;
            std::atomic<int>            clears;

            ScriptedIo(const std::vector<ScriptStep>& arg_steps) :
                steps(arg_steps), cursor(0), gets(0), clears(0) { }

            int doGet(Edge arg_expected, Edge& arg_edge) {
                gets.fetch_add(1);

                if (cursor >= steps.size())
                    return RETCODE_IO;

                const ScriptStep& step = steps[cursor++];
                std::this_thread::sleep_for(step.delay);

                arg_edge = step.edge;
                return step.retcode;
            }

            int doClear() {
                clears.fetch_add(1);
                return RETCODE_OK;
            }
        };

        //
        // Same script, replayed on an io_context.
        class ScriptedIoAsync : public WatchdogIoAsync {
        private:
            boost::asio::io_context&    io_ctx;
            boost::asio::steady_timer   step_timer;

            std::vector<ScriptStep>     steps;
            size_t                      cursor;

        public:
            std::atomic<int>            gets;
            std::atomic<int>            clears;

            ScriptedIoAsync(boost::asio::io_context& arg_io_ctx, const std::vector<ScriptStep>& arg_steps) :
                io_ctx(arg_io_ctx), step_timer(arg_io_ctx), steps(arg_steps), cursor(0), gets(0), clears(0) { }

            void doAsyncGet(Edge arg_expected, GetHandler arg_handler) {
                gets.fetch_add(1);

                if (cursor >= steps.size()) {
                    boost::asio::post(io_ctx, [arg_handler, arg_expected]() { arg_handler(RETCODE_IO, arg_expected); });
                    return;
                }

                ScriptStep step = steps[cursor++];

                step_timer.expires_after(step.delay);
                step_timer.async_wait([arg_handler, step](const boost::system::error_code&) {
                    arg_handler(step.retcode, step.edge);
                });
            }

            void doAsyncClear(ClearHandler arg_handler) {
                clears.fetch_add(1);
                boost::asio::post(io_ctx, [arg_handler]() { arg_handler(RETCODE_OK); });
            }
        };

        struct RecordedEvent {
            StateEvent          event;
            Clock::time_point   at;
        };

        //
        // Drains a StateReceiver on its own thread and timestamps what it reads.
        class EventCollector {
        private:
            StateReceiver               state_rx;
            std::thread                 collector;
            std::atomic<bool>           alive;

            mutable std::mutex          events_lock;
            std::vector<RecordedEvent>  events;

        public:
            EventCollector(StateReceiver arg_rx) : state_rx(arg_rx), alive(true) {
                collector = std::thread([this]() {
                    StateEvent event;
                    while (alive.load()) {
                        int ret = state_rx.doRecv(event, std::chrono::milliseconds(20));
                        if (ret == RETCODE_CLOSED)
                            break;

                        if (ret != RETCODE_OK)
                            continue;

                        RecordedEvent recorded = { event, Clock::now() };

                        std::lock_guard<std::mutex> guard(events_lock);
                        events.push_back(recorded);
                    }
                });
            }

            ~EventCollector() { doStop(); }

            void doStop() {
                alive.store(false);
                if (collector.joinable())
                    collector.join();
            }

            std::vector<RecordedEvent> getEvents() const {
                std::lock_guard<std::mutex> guard(events_lock);
                return events;
            }

            size_t countOf(const StateEvent& arg_event) const {
                std::lock_guard<std::mutex> guard(events_lock);

                size_t count = 0;
                for (auto& recorded: events)
                    if (recorded.event == arg_event)
                        count++;

                return count;
            }

            //
            // Polls until arg_event was seen or arg_timeout passed.
            bool doWaitFor(const StateEvent& arg_event, Duration arg_timeout) const {
                Clock::time_point deadline = Clock::now() + arg_timeout;
                while (Clock::now() < deadline) {
                    if (countOf(arg_event) > 0)
                        return true;

                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                return countOf(arg_event) > 0;
            }
        };
    }
}
