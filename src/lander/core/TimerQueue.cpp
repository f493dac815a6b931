/**
 * TimerQueue.cpp
 */

#include "TimerQueue.h"

namespace Lander {

TimerHandle TimerQueue::schedule(TimeMs now, TimeMs delayMs, TimerCallback callback) {
    if (!callback) return INVALID_TIMER;
    
    Entry entry;
    entry.deadline = now + (delayMs > 0.0 ? delayMs : 0.0);
    entry.sequence = nextSequence_++;
    entry.handle = entry.sequence;
    entry.callback = std::move(callback);
    
    TimerHandle handle = entry.handle;
    pending_.push(std::move(entry));
    live_.insert(handle);
    return handle;
}

bool TimerQueue::cancel(TimerHandle handle) {
    // Lazy removal: the queued entry is skipped when it comes due
    return live_.erase(handle) > 0;
}

size_t TimerQueue::processDue(TimeMs now) {
    // Collect first so callbacks that schedule more work cannot run this tick
    std::vector<Entry> due;
    while (!pending_.empty() && pending_.top().deadline <= now) {
        due.push_back(pending_.top());
        pending_.pop();
    }
    
    size_t fired = 0;
    for (auto& entry : due) {
        if (live_.erase(entry.handle) == 0) continue;
        entry.callback();
        ++fired;
    }
    return fired;
}

void TimerQueue::clear() {
    pending_ = {};
    live_.clear();
}

} // namespace Lander
