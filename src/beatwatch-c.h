#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#ifdef __cplusplus

#include <cstdint>
#include <cstddef>

//
// This is C-wrapper for Beatwatch.
//  Functions below cover a UDP watchdog and a UDP heart.
//
//  Wrapped functions of Beatwatch starts with `cw`.
//

extern "C" {
#else

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#endif

// Watchdog. A window of 0 selects the default timeout range.
void*   cwCreateUdpWatchdog(const char*, uint16_t, uint32_t, uint32_t);
uint16_t cwGetWatchdogPort(void*);              // The bound port, when created on port 0.
int     cwLaunchWatchdog(void*);                // Runs the watchdog on its own thread.
int     cwGetWatchdogState(void*);              // 1: OK, 0: FAULT.
int     cwPollWatchdogEvent(void*, int*, int*); // 1 if an event was read: state, fault kind.
int     cwStopWatchdog(void*);                  // Returns the retcode of the run loop.
void    cwDestroyWatchdog(void*);

// Heart.
void*   cwCreateUdpHeart(const char*, uint16_t);
int     cwBeat(void*);
void    cwDestroyHeart(void*);

#ifdef __cplusplus
}
#endif
