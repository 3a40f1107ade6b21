#pragma once

// C++ Standard Library
#include <array>
#include <cstddef>
#include <stdexcept>

// Fixed-capacity FIFO of x-coordinates. Pushing onto a full buffer drops the
// oldest sample.
class PositionHistory {
public:
    static constexpr std::size_t CAPACITY = 15;

    PositionHistory() : head(0), count(0) {
        samples.fill(0.0);
    }

    void push(double x) {
        samples[(head + count) % CAPACITY] = x;
        if (count < CAPACITY) {
            count++;
        } else {
            head = (head + 1) % CAPACITY;
        }
    }

    void clear() {
        head = 0;
        count = 0;
    }

    std::size_t size() const { return count; }
    bool empty() const { return count == 0; }
    bool full() const { return count == CAPACITY; }

    // 0 is the oldest sample
    double operator[](std::size_t i) const {
        return samples[(head + i) % CAPACITY];
    }

    double at(std::size_t i) const {
        if (i >= count) {
            throw std::out_of_range("PositionHistory index out of range");
        }
        return (*this)[i];
    }

    double front() const { return (*this)[0]; }
    double back() const { return (*this)[count - 1]; }

private:
    std::array<double, CAPACITY> samples;
    std::size_t head;
    std::size_t count;
};
