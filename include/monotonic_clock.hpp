#pragma once

#include <chrono>

// Seconds since an arbitrary fixed origin; never goes backwards.
class MonotonicClock {
public:
    virtual ~MonotonicClock() = default;
    virtual double now() const = 0;
};

class SteadyClock : public MonotonicClock {
public:
    SteadyClock() : origin(std::chrono::steady_clock::now()) {}

    double now() const override {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - origin;
        return elapsed.count();
    }

private:
    std::chrono::steady_clock::time_point origin;
};
