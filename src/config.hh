#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include <cstdint>

#include "commons.hh"

namespace beatwatch {

    const uint32_t DEFAULT_MIN_BEATS = 2;
    const uint32_t MAX_MIN_BEATS = UINT32_MAX / 2;

    //
    // WatchdogConfig is built once (builder setters) and then only read.
    // The defaults derive from the interval:
    //  - range:     Timeout(interval / 10), i.e. a deadline 10% over the interval.
    //  - warmup:    2 x interval.
    //  - min_beats: 2 full alternation cycles before recovering to Ok.
    class WatchdogConfig {
    private:
        Duration        interval;
        Range           range;
        Duration        warmup;
        uint32_t        min_beats;

    public:
        WatchdogConfig(Duration);
        ~WatchdogConfig() { }

        WatchdogConfig& setRange(Range);
        WatchdogConfig& setWarmup(Duration);
        WatchdogConfig& setMinBeats(uint32_t);

        Duration getInterval() const;
        const Range& getRange() const;
        Duration getWarmup() const;
        uint32_t getMinBeats() const;

        Duration getIoTimeout() const;      // Deadline handed to the I/O backends.
        Duration getEarliestBeat() const;   // Lower bound of a Window range.

        bool isValid() const;
    };
}
