// Generic reuse container: owned instances split into active and inactive sets.
#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../core/Logger.h"
#include "../math/Vec3.h"

namespace Bulwark {

// T must provide setActive(bool); the positioned get() also needs setPose(position, forward).
template <typename T>
class Pool {
public:
    using Factory = std::function<std::unique_ptr<T>()>;
    using Hook = std::function<void(T&)>;

    explicit Pool(Factory factory, std::string name = "Pool", bool expandable = true)
        : factory_(std::move(factory)), name_(std::move(name)), expandable_(expandable) {}

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    void setHooks(Hook onGet, Hook onReturn) {
        onGet_ = std::move(onGet);
        onReturn_ = std::move(onReturn);
    }

    // Reuses an inactive instance or creates one; nullptr when a fixed-size pool is exhausted.
    T* get() {
        T* item = nullptr;
        if (!inactive_.empty()) {
            item = inactive_.back();
            inactive_.pop_back();
        } else if (expandable_) {
            item = createInstance();
            if (!item) return nullptr;
        } else {
            logWarn("[Pool:" + name_ + "] exhausted (" + std::to_string(owned_.size()) + " instances)");
            return nullptr;
        }
        active_.push_back(item);
        item->setActive(true);
        if (onGet_) onGet_(*item);
        return item;
    }

    T* get(const Vec3& position, const Vec3& forward) {
        T* item = get();
        if (item) item->setPose(position, forward);
        return item;
    }

    // Deactivates before the instance becomes reusable. Untracked instances are warned
    // about and still deactivated, but never enter the inactive stack twice.
    void release(T& item) {
        auto it = std::find(active_.begin(), active_.end(), &item);
        const bool tracked = it != active_.end();
        if (tracked) {
            *it = active_.back();
            active_.pop_back();
        } else {
            logWarn("[Pool:" + name_ + "] returning an instance that is not active in this pool");
        }

        if (onReturn_) onReturn_(item);
        item.setActive(false);

        if (tracked || (owns(item) && !isInactive(item))) {
            inactive_.push_back(&item);
        }
    }

    void prewarm(std::size_t count) {
        for (std::size_t i = 0; i < count; ++i) {
            T* item = createInstance();
            if (!item) return;
            item->setActive(false);
            inactive_.push_back(item);
        }
    }

    void releaseAll() {
        // release() mutates active_.
        std::vector<T*> snapshot = active_;
        for (T* item : snapshot) {
            release(*item);
        }
    }

    // Destroys every instance; outstanding pointers become invalid.
    void clear() {
        active_.clear();
        inactive_.clear();
        owned_.clear();
    }

    bool isActive(const T& item) const {
        return std::find(active_.begin(), active_.end(), &item) != active_.end();
    }

    bool owns(const T& item) const {
        return std::any_of(owned_.begin(), owned_.end(), [&](const auto& p) { return p.get() == &item; });
    }

    template <typename Func>
    void forEachActive(Func&& func) const {
        for (T* item : active_) func(*item);
    }

    std::size_t activeCount() const { return active_.size(); }
    std::size_t inactiveCount() const { return inactive_.size(); }
    std::size_t totalCount() const { return active_.size() + inactive_.size(); }
    std::size_t createdCount() const { return owned_.size(); }
    bool expandable() const { return expandable_; }
    void setExpandable(bool value) { expandable_ = value; }
    const std::string& name() const { return name_; }

private:
    bool isInactive(const T& item) const {
        return std::find(inactive_.begin(), inactive_.end(), &item) != inactive_.end();
    }

    T* createInstance() {
        if (!factory_) {
            logError("[Pool:" + name_ + "] no factory configured");
            return nullptr;
        }
        std::unique_ptr<T> instance = factory_();
        if (!instance) {
            logError("[Pool:" + name_ + "] factory returned null");
            return nullptr;
        }
        owned_.push_back(std::move(instance));
        return owned_.back().get();
    }

    Factory factory_;
    Hook onGet_;
    Hook onReturn_;
    std::string name_;
    bool expandable_{true};
    std::vector<std::unique_ptr<T>> owned_;
    std::vector<T*> active_;
    std::vector<T*> inactive_;
};

}  // namespace Bulwark
