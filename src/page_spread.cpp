// page_spread.cpp
#include "page_spread.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

PageSpread::PageSpread(int pageCount) : count(pageCount), current(0) {
    if (pageCount < 0) {
        throw std::invalid_argument("Page count must not be negative: " + std::to_string(pageCount));
    }
}

bool PageSpread::nextSpread() {
    // Move by 2 to get to the next spread
    if (current < count - 1) {
        current = std::min(current + 2, count - 1);
        return true;
    }
    return false;
}

bool PageSpread::previousSpread() {
    if (current > 0) {
        current = std::max(current - 2, 0);
        return true;
    }
    return false;
}

bool PageSpread::apply(GestureEvent event) {
    switch (event) {
        case GestureEvent::Left:
            return nextSpread();
        case GestureEvent::Right:
            return previousSpread();
        default:
            return false;
    }
}

PageSpread::VisiblePages PageSpread::visiblePages() const {
    VisiblePages pages;
    if (current % 2 == 0) {
        // Even page on the right
        if (current > 0) {
            pages.left = current - 1;
        }
        if (current < count) {
            pages.right = current;
        }
    } else {
        // Odd page on the left
        pages.left = current;
        if (current + 1 < count) {
            pages.right = current + 1;
        }
    }
    return pages;
}
