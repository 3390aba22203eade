#include "timer.hpp"

RetransmitTimer::RetransmitTimer(unsigned int timeout)
    : timeout_ms(timeout), is_running(false) {
}

void RetransmitTimer::start(Clock::time_point now) {
    if (is_running) {
        return;
    }
    restart(now);
}

void RetransmitTimer::restart(Clock::time_point now) {
    is_running = true;
    expires_at = now + std::chrono::milliseconds(timeout_ms);
}

void RetransmitTimer::stop() {
    is_running = false;
}

bool RetransmitTimer::expired(Clock::time_point now) const {
    return is_running && now >= expires_at;
}
