#pragma once
/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include "logger.hh"    // Beatwatch Logger

#include "commons.hh"
#include "config.hh"
#include "channel.hh"

//
// Transport boundary: what a backend and a heart have to provide.
#include "io.hh"

//
// The decision algorithm, and the two run loops built on it:
//  Watchdog occupies a thread, WatchdogAsync runs on a boost::asio::io_context.
#include "processor.hh"
#include "watchdog.hh"
#include "watchdog-async.hh"

//
// Beat senders and the bundled backends.
#include "heartbeat.hh"
#include "local-line.hh"
#include "udp.hh"
