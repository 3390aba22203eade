#ifndef TIMER_HPP
#define TIMER_HPP
#include <chrono>

// Single retransmission timer for the oldest unacknowledged segment.
// Not synchronized: the owner guards it with its window lock so that
// expiry checks and ACK processing are serialized.
class RetransmitTimer {
public:
    typedef std::chrono::steady_clock Clock;

    explicit RetransmitTimer(unsigned int timeout);

    // start counting down unless already running
    void start(Clock::time_point now = Clock::now());
    // count down a full interval from now
    void restart(Clock::time_point now = Clock::now());
    void stop();

    bool running() const {
        return is_running;
    }
    bool expired(Clock::time_point now = Clock::now()) const;
    Clock::time_point deadline() const {
        return expires_at;
    }
    unsigned int get_timeout() const {
        return timeout_ms;
    }

private:
    unsigned int timeout_ms;
    bool is_running;
    Clock::time_point expires_at;
};

#endif
