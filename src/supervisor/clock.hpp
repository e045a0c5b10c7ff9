#pragma once

#include <chrono>
#include <ctime>

/// One reading of the monotonic and the wall clock.
/// Windows, cooldowns and grace periods are measured on `mono`; `wall` is
/// only shown to operators and written to the audit log.
struct Instant {
    std::chrono::steady_clock::time_point mono;
    std::chrono::system_clock::time_point wall;

    template <class Rep, class Period>
    Instant& operator+=(std::chrono::duration<Rep, Period> d) {
        mono += std::chrono::duration_cast<std::chrono::steady_clock::duration>(d);
        wall += std::chrono::duration_cast<std::chrono::system_clock::duration>(d);
        return *this;
    }

    template <class Rep, class Period>
    Instant& operator-=(std::chrono::duration<Rep, Period> d) {
        return *this += -d;
    }
};

template <class Rep, class Period>
Instant operator+(Instant t, std::chrono::duration<Rep, Period> d) {
    t += d;
    return t;
}

template <class Rep, class Period>
Instant operator-(Instant t, std::chrono::duration<Rep, Period> d) {
    t -= d;
    return t;
}

/// Elapsed monotonic time between two readings
inline std::chrono::steady_clock::duration operator-(const Instant& a, const Instant& b) {
    return a.mono - b.mono;
}

inline bool operator==(const Instant& a, const Instant& b) {
    return a.mono == b.mono && a.wall == b.wall;
}

inline bool operator!=(const Instant& a, const Instant& b) {
    return !(a == b);
}

struct SupervisorClock {
    static Instant now() {
        return {std::chrono::steady_clock::now(), std::chrono::system_clock::now()};
    }

    /// Both parts offset by t from their epochs
    static Instant from_time_t(std::time_t t) {
        auto since = std::chrono::seconds(t);
        return {std::chrono::steady_clock::time_point(
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(since)),
                std::chrono::system_clock::from_time_t(t)};
    }

    /// Place a recorded wall time on the monotonic clock relative to `now`.
    /// Wall times later than now.wall are clamped to now.
    static Instant at_wall(std::chrono::system_clock::time_point wall, const Instant& now) {
        if (wall >= now.wall) return {now.mono, wall};
        auto age = std::chrono::duration_cast<std::chrono::steady_clock::duration>(now.wall - wall);
        return {now.mono - age, wall};
    }
};
