
#pragma once

#include <functional>

// precedes(a, b) == true means: a must be emitted before b if both are available.
// Must be irreflexive. Orders which are not strict weak orders do not lose or
// duplicate items, but leave the relative order of the affected items unspecified.
template <typename T>
using Precedence = std::function<bool(const T&, const T&)>;

namespace Comparators {

// Smallest item first.
template <typename T>
Precedence<T> ascending() {
    return [](const T& a, const T& b) {return a < b;};
}

// Largest item first.
template <typename T>
Precedence<T> descending() {
    return [](const T& a, const T& b) {return b < a;};
}

}
