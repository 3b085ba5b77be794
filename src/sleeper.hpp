#pragma once

#include <chrono>

// Time source and blocking wait for the politeness delay and retry backoff.
class Sleeper {
public:
    using clock = std::chrono::steady_clock;

    virtual ~Sleeper() = default;
    virtual clock::time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds d) = 0;
};

class SystemSleeper : public Sleeper {
public:
    clock::time_point now() const override;
    void sleep_for(std::chrono::milliseconds d) override;
};
