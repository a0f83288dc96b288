#pragma once

#include <cassert>
#include <cstdint>
#include <limits>

namespace Metronome::ECS {

// ---------------------------------------------------------------------------
// EntityId — a 32-bit process-unique entity identifier.
//
// Ids are handed out by an IdAllocator and never change for the lifetime of
// the Entity that carries them. The Registry does not verify uniqueness; it
// relies on every entity in one world being built from the same allocator.
// ---------------------------------------------------------------------------

using EntityId = uint32_t;

// Sentinel value representing a null / invalid entity. Never allocated.
inline constexpr EntityId INVALID_ENTITY = std::numeric_limits<EntityId>::max();

// Monotonic id source. Ids are not recycled, so an id stays unique among all
// entities built from this allocator, live or not.
class IdAllocator {
public:
    explicit IdAllocator(EntityId first = 1u) noexcept : m_next(first) {}

    [[nodiscard]] EntityId Next() noexcept {
        assert(m_next != INVALID_ENTITY && "IdAllocator — id space exhausted");
        return m_next++;
    }

    // The id the next call to Next() will return.
    [[nodiscard]] EntityId Peek() const noexcept { return m_next; }

private:
    EntityId m_next;
};

} // namespace Metronome::ECS
