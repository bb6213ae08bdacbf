// ECS registry: versioned entity lifecycle + component lookup table.
#pragma once

#include <cstdint>
#include <queue>
#include <tuple>
#include <vector>

#include "ComponentStorage.h"
#include "Entity.h"

namespace Bulwark::ECS {

class Registry {
public:
    Registry() { versions_.push_back(0); }

    Entity create() {
        std::uint32_t index;
        if (!freeList_.empty()) {
            index = freeList_.front();
            freeList_.pop();
        } else {
            index = static_cast<std::uint32_t>(versions_.size());
            versions_.push_back(1);
        }
        ++liveCount_;
        return Entity{index, versions_[index]};
    }

    // Stale or already destroyed handles are ignored.
    void destroy(Entity e) {
        if (!alive(e)) {
            return;
        }
        storage_.removeAll(e);
        ++versions_[e.index];
        freeList_.push(e.index);
        --liveCount_;
    }

    bool alive(Entity e) const {
        return e.index != 0 && e.index < versions_.size() && versions_[e.index] == e.version;
    }

    std::size_t liveCount() const { return liveCount_; }

    template <typename T, typename... Args>
    T& emplace(Entity e, Args&&... args) {
        return storage_.template pool<T>().emplace(e, std::forward<Args>(args)...);
    }

    template <typename T>
    void remove(Entity e) {
        storage_.template pool<T>().remove(e);
    }

    template <typename T>
    T* get(Entity e) {
        if (!alive(e)) return nullptr;
        return storage_.template pool<T>().get(e);
    }

    template <typename T>
    const T* get(Entity e) const {
        if (!alive(e)) return nullptr;
        const auto* p = storage_.template pool<T>();
        return p ? p->get(e) : nullptr;
    }

    template <typename T>
    bool has(Entity e) const {
        const auto* p = storage_.template pool<T>();
        return alive(e) && p && p->contains(e);
    }

    template <typename Primary, typename... Rest, typename Func>
    void view(Func&& func) {
        auto& primaryPool = storage_.template pool<Primary>();
        for (auto& [entity, primary] : primaryPool) {
            if ((storage_.template pool<Rest>().contains(entity) && ...)) {
                func(entity, primary, *storage_.template pool<Rest>().get(entity)...);
            }
        }
    }

    template <typename Primary, typename... Rest, typename Func>
    void view(Func&& func) const {
        const auto* primaryPool = storage_.template pool<Primary>();
        if (!primaryPool) {
            return;
        }
        for (const auto& [entity, primary] : *primaryPool) {
            bool allHave = ((storage_.template pool<Rest>() && storage_.template pool<Rest>()->contains(entity)) && ...);
            if (allHave) {
                func(entity, primary, *storage_.template pool<Rest>()->get(entity)...);
            }
        }
    }

    void clear() {
        storage_.clear();
        versions_.assign(1, 0);
        freeList_ = {};
        liveCount_ = 0;
    }

private:
    std::vector<std::uint32_t> versions_;
    std::queue<std::uint32_t> freeList_;
    std::size_t liveCount_{0};
    ComponentStorage storage_;
};

}  // namespace Bulwark::ECS
