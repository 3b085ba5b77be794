#include "sleeper.hpp"

#include <thread>

Sleeper::clock::time_point SystemSleeper::now() const {
    return clock::now();
}

void SystemSleeper::sleep_for(std::chrono::milliseconds d) {
    if (d.count() > 0) std::this_thread::sleep_for(d);
}
