#pragma once

// C++ Standard Library
#include <optional>

#include "swipe_classifier.hpp"

// Two facing pages over a book of known length. Indices are zero-based.
class PageSpread {
public:
    struct VisiblePages {
        std::optional<int> left;
        std::optional<int> right;
    };

    explicit PageSpread(int pageCount);

    bool nextSpread();
    bool previousSpread();

    // Left swipe advances, right swipe goes back
    bool apply(GestureEvent event);

    VisiblePages visiblePages() const;

    int currentPage() const { return current; }
    int pageCount() const { return count; }

private:
    int count;
    int current;
};
