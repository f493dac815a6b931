/**
 * TimerQueue.h
 * 
 * Deferred callbacks keyed to simulation time
 * 
 * Features:
 * - Schedule a closure for a future timestamp
 * - Callbacks fire only at tick boundaries, in deadline order
 * - Callbacks scheduled while the queue is draining wait for the next tick
 * - Cancellation by handle
 */

#pragma once

#include "Types.h"
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

namespace Lander {

using TimerCallback = std::function<void()>;
using TimerHandle = uint64_t;
constexpr TimerHandle INVALID_TIMER = 0;

class TimerQueue {
public:
    /**
     * Schedule a callback delayMs after now
     * @return Handle usable with cancel()
     */
    TimerHandle schedule(TimeMs now, TimeMs delayMs, TimerCallback callback);
    
    /** Drop a pending callback. Returns false if it already fired or is unknown */
    bool cancel(TimerHandle handle);
    
    /**
     * Fire every callback whose deadline is <= now
     * @return Number of callbacks run
     */
    size_t processDue(TimeMs now);
    
    void clear();
    
    size_t pendingCount() const { return live_.size(); }
    bool empty() const { return pendingCount() == 0; }
    
private:
    struct Entry {
        TimeMs deadline;
        uint64_t sequence;
        TimerHandle handle;
        TimerCallback callback;
    };
    
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.sequence > b.sequence;
        }
    };
    
    std::priority_queue<Entry, std::vector<Entry>, Later> pending_;
    std::unordered_set<TimerHandle> live_;      // Scheduled and not yet fired or cancelled
    uint64_t nextSequence_ = 1;
};

} // namespace Lander
