// Versioned entity handle: slot index plus generation.
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace Bulwark::ECS {

struct Entity {
    std::uint32_t index{0};
    std::uint32_t version{0};

    bool valid() const { return index != 0; }
    explicit operator bool() const { return valid(); }

    bool operator==(const Entity& rhs) const { return index == rhs.index && version == rhs.version; }
    bool operator!=(const Entity& rhs) const { return !(*this == rhs); }
};

// Index 0 is never issued.
constexpr Entity kInvalidEntity{};

}  // namespace Bulwark::ECS

namespace std {
template <>
struct hash<Bulwark::ECS::Entity> {
    size_t operator()(const Bulwark::ECS::Entity& e) const noexcept {
        return hash<uint64_t>{}((static_cast<uint64_t>(e.version) << 32) | e.index);
    }
};
}  // namespace std
