/* beatwatch - heartbeat supervision watchdog
 * @author: beatwatch developers
 *
 * Project BEATWATCH
 */

#include "channel.hh"

beatwatch::StateSender beatwatch::makeStateChannel() {
    return StateSender(std::make_shared<ChannelSlot>());
}



beatwatch::StateSender::StateSender(std::shared_ptr<ChannelSlot> arg_slot) : slot(arg_slot) { }

/// @brief Publishes an event. The previous unread value, if any, is dropped.
/// @param arg_event
/// @return RETCODE_CLOSED after doClose(), RETCODE_OK otherwise.
int beatwatch::StateSender::doSend(const StateEvent& arg_event) {

    {
        std::lock_guard<std::mutex> guard(slot->slot_lock);
        if (slot->closed)
            return RETCODE_CLOSED;

        slot->latest = arg_event;
        slot->seq++;
    }

    slot->slot_cv.notify_all();
    return RETCODE_OK;
}

void beatwatch::StateSender::doClose() {

    {
        std::lock_guard<std::mutex> guard(slot->slot_lock);
        slot->closed = true;
    }

    slot->slot_cv.notify_all();
}

//
// A new receiver starts at the current sequence: it observes only what is
//  published after this call.
beatwatch::StateReceiver beatwatch::StateSender::getReceiver() const {
    StateReceiver receiver(slot);
    return receiver;
}



beatwatch::StateReceiver::StateReceiver(std::shared_ptr<ChannelSlot> arg_slot) : slot(arg_slot), seen(0) {
    std::lock_guard<std::mutex> guard(slot->slot_lock);
    seen = slot->seq;
}

bool beatwatch::StateReceiver::doTryRecv(StateEvent& arg_event) {

    std::lock_guard<std::mutex> guard(slot->slot_lock);
    if (slot->seq == seen)
        return false;

    arg_event = slot->latest;
    seen = slot->seq;

    return true;
}



/// @brief Waits up to arg_timeout for an unread event.
///  An unread event is still delivered after the channel closed.
/// @param arg_event
/// @param arg_timeout
/// @return
int beatwatch::StateReceiver::doRecv(StateEvent& arg_event, Duration arg_timeout) {

    std::unique_lock<std::mutex> lock(slot->slot_lock);

    bool ready = slot->slot_cv.wait_for(lock, arg_timeout, [this]() {
        return (slot->seq != seen) || slot->closed;
    });

    if (slot->seq != seen) {
        arg_event = slot->latest;
        seen = slot->seq;

        return RETCODE_OK;
    }

    if (ready && slot->closed)
        return RETCODE_CLOSED;

    return RETCODE_TIMEOUT;
}

bool beatwatch::StateReceiver::isClosed() const {
    std::lock_guard<std::mutex> guard(slot->slot_lock);
    return slot->closed;
}
