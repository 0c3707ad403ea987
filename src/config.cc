/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include "config.hh"

beatwatch::WatchdogConfig::WatchdogConfig(Duration arg_interval) :
    interval(arg_interval), range(Range::makeTimeout(arg_interval / 10)),
    warmup(arg_interval * 2), min_beats(DEFAULT_MIN_BEATS) { }

beatwatch::WatchdogConfig& beatwatch::WatchdogConfig::setRange(Range arg_range) {
    range = arg_range;
    return *this;
}

beatwatch::WatchdogConfig& beatwatch::WatchdogConfig::setWarmup(Duration arg_warmup) {
    warmup = arg_warmup;
    return *this;
}

beatwatch::WatchdogConfig& beatwatch::WatchdogConfig::setMinBeats(uint32_t arg_min_beats) {
    min_beats = arg_min_beats;
    return *this;
}

// Getters
beatwatch::Duration beatwatch::WatchdogConfig::getInterval() const { return interval; }
const beatwatch::Range& beatwatch::WatchdogConfig::getRange() const { return range; }
beatwatch::Duration beatwatch::WatchdogConfig::getWarmup() const { return warmup; }
uint32_t beatwatch::WatchdogConfig::getMinBeats() const { return min_beats; }



/// @brief The I/O deadline: one interval plus the tolerance of the range,
///  whichever kind the range is. A late beat of a Window range faults here.
/// @return
beatwatch::Duration beatwatch::WatchdogConfig::getIoTimeout() const {
    return interval + range.getTimeout();
}



/// @brief Earliest acceptable elapsed time between two polls under a Window range.
///  A window wider than the interval has no lower bound.
/// @return
beatwatch::Duration beatwatch::WatchdogConfig::getEarliestBeat() const {
    if (range.getTimeout() >= interval)
        return Duration::zero();

    return interval - range.getTimeout();
}

//
// The recovery threshold is min_beats x 2 edges, it has to fit a uint32_t.
bool beatwatch::WatchdogConfig::isValid() const {
    return (interval > Duration::zero()) && (min_beats >= 1) && (min_beats <= MAX_MIN_BEATS) &&
        (range.getTimeout() >= Duration::zero()) && (warmup >= Duration::zero());
}
