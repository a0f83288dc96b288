#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <utility>
#include <vector>

namespace Metronome::ECS {

// ---------------------------------------------------------------------------
// FastRemove — O(1) unordered erase for std::vector.
//
// The element at `index` is overwritten by the last element and the vector
// shrinks by one (the same swap-with-last trick a sparse set uses to stay
// packed). The relative order of the remaining elements is NOT preserved, so
// callers must tolerate the last element moving into the hole.
// ---------------------------------------------------------------------------
template<typename T>
void FastRemove(std::vector<T>& items, size_t index) {
    assert(index < items.size() && "FastRemove — index out of range");

    const size_t last = items.size() - 1u;
    if (index != last)
        items[index] = std::move(items[last]);
    items.pop_back();
}

// Remove the first element equal to value.
// Returns false (and leaves the vector untouched) if nothing matched.
template<typename T, typename U>
bool FastRemoveValue(std::vector<T>& items, const U& value) {
    const auto it = std::find(items.begin(), items.end(), value);
    if (it == items.end()) return false;
    FastRemove(items, static_cast<size_t>(it - items.begin()));
    return true;
}

} // namespace Metronome::ECS
