#pragma once
#include <vector>
#include <string>
#include <stdexcept>
#include "time_util.h"

namespace utils {

    /*
     * Checks if more than "count" events happen in the trailing
     * "TimeWindow".  Event times are kept in a circular buffer of
     * size "count".  Upon a new event, the time stamp it would overwrite
     * is the count-th previous event; if that is still within the window,
     * the limit is broken.
     *
     * Note: it is not thread safe, each owner checks on its own thread.
     */
    class RateLimiter {
    public:
        RateLimiter(const int count, time_t TimeWindow_In_Second);

        // this checks if an event happening at cur_micro would violate the limit
        // return 0 if not, otherwise, micro_seconds before ok
        uint64_t checkOnly(uint64_t cur_micro) const;

        // same as checkOnly(), in addition, it counts the event if the
        // limit is not violated
        uint64_t check(uint64_t cur_micro);
        uint64_t check();  // short hand for check(TimeUtil::cur_micro())

        int count() const { return _count; };
        std::string toString() const;

    private:
        const int _count;
        const long long _twnd;
        std::vector<long long> _event;
        long long _idx;
    };

    inline
    RateLimiter::RateLimiter(const int count, time_t TimeWindow_In_Second)
    : _count(count), _twnd((long long)TimeWindow_In_Second*1000000LL), _idx(0)
    {
        if (count <= 0 || TimeWindow_In_Second <= 0) {
            throw std::invalid_argument("RateLimiter count and time window have to be positive");
        }
        _event.resize(count, 0);
    }

    inline
    uint64_t RateLimiter::checkOnly(uint64_t cur_micro) const {
        if (_idx < _count) {
            return 0;
        }
        const long long oldest = _event[_idx % _count];
        const long long wait = oldest + _twnd - (long long)cur_micro;
        return wait > 0 ? (uint64_t)wait : 0;
    }

    inline
    uint64_t RateLimiter::check(uint64_t cur_micro) {
        uint64_t wait = checkOnly(cur_micro);
        if (wait == 0) {
            _event[_idx % _count] = (long long)cur_micro;
            ++_idx;
        }
        return wait;
    }

    inline
    uint64_t RateLimiter::check() {
        return check(TimeUtil::cur_micro());
    }

    inline
    std::string RateLimiter::toString() const {
        return std::to_string(_count) + " events in " + std::to_string(_twnd/1000000LL) +
               " seconds, total " + std::to_string(_idx) + " counted";
    }
}
