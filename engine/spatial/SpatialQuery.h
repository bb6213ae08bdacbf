// Fixed-capacity proximity query contract.
#pragma once

#include <array>
#include <cstddef>

#include "../ecs/Entity.h"
#include "../ecs/components/Collider.h"
#include "../math/Vec3.h"

namespace Bulwark {

constexpr std::size_t kQueryBufferCapacity = 32;

class ISpatialQuery {
public:
    virtual ~ISpatialQuery() = default;

    // Writes up to `capacity` entities whose hit volume overlaps the sphere and whose
    // category intersects `mask`. Returns the number written; excess hits are dropped.
    virtual std::size_t overlapSphere(const Vec3& center, float radius, ECS::CategoryMask mask, ECS::Entity* out,
                                      std::size_t capacity) const = 0;
};

// Reusable result arena so queries never allocate.
template <std::size_t N = kQueryBufferCapacity>
struct QueryBuffer {
    std::array<ECS::Entity, N> slots{};
    std::size_t count{0};

    std::size_t query(const ISpatialQuery& space, const Vec3& center, float radius, ECS::CategoryMask mask) {
        count = space.overlapSphere(center, radius, mask, slots.data(), N);
        return count;
    }

    bool saturated() const { return count >= N; }
    static constexpr std::size_t capacity() { return N; }

    const ECS::Entity* begin() const { return slots.data(); }
    const ECS::Entity* end() const { return slots.data() + count; }
};

}  // namespace Bulwark
