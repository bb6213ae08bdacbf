// Pool<T> lifecycle: get/release accounting, hooks, exhaustion and untracked returns.
#include <cassert>
#include <memory>

#include "../engine/pool/Pool.h"
#include "TestSupport.h"

using Bulwark::Pool;
using Bulwark::Vec3;

namespace {
struct Widget {
    bool active{false};
    int value{0};
    int resets{0};
    Vec3 position{};
    Vec3 forward{};

    void setActive(bool a) { active = a; }
    void setPose(const Vec3& p, const Vec3& f) {
        position = p;
        forward = f;
    }
};

Pool<Widget> makePool(bool expandable = true) {
    return Pool<Widget>([]() { return std::make_unique<Widget>(); }, "Widget", expandable);
}

void checkAccounting(const Pool<Widget>& pool) {
    assert(pool.activeCount() + pool.inactiveCount() == pool.createdCount());
}
}  // namespace

int main() {
    {
        // Empty pool creates on demand.
        auto pool = makePool();
        Widget* a = pool.get();
        assert(a && a->active);
        assert(pool.activeCount() == 1);
        assert(pool.createdCount() == 1);
        checkAccounting(pool);
    }
    {
        // Prewarm fills the inactive stack without activating anything.
        auto pool = makePool();
        pool.prewarm(4);
        assert(pool.inactiveCount() == 4);
        assert(pool.activeCount() == 0);
        Widget* a = pool.get();
        assert(pool.createdCount() == 4);
        assert(pool.inactiveCount() == 3);
        assert(pool.isActive(*a));
        checkAccounting(pool);
    }
    {
        // Release then get hands back the same, reset instance.
        auto pool = makePool();
        pool.setHooks(nullptr, [](Widget& w) {
            w.value = 0;
            ++w.resets;
        });
        Widget* a = pool.get();
        a->value = 42;
        pool.release(*a);
        assert(!a->active);
        assert(a->value == 0);
        Widget* b = pool.get();
        assert(b == a);
        assert(b->active);
        assert(b->value == 0);
        assert(b->resets == 1);
        checkAccounting(pool);
    }
    {
        // Positioned get applies the pose after activation.
        auto pool = makePool();
        Widget* a = pool.get(Vec3{1.0f, 2.0f, 3.0f}, Vec3{0.0f, 0.0f, 1.0f});
        assert(a->position == Vec3(1.0f, 2.0f, 3.0f));
        assert(a->forward == Vec3(0.0f, 0.0f, 1.0f));
    }
    {
        // Get hook runs on every acquisition.
        auto pool = makePool();
        int gets = 0;
        pool.setHooks([&gets](Widget&) { ++gets; }, nullptr);
        Widget* a = pool.get();
        pool.release(*a);
        pool.get();
        assert(gets == 2);
    }
    {
        // Double release warns, deactivates, and never duplicates the instance.
        TestSupport::LogCapture log;
        auto pool = makePool();
        Widget* a = pool.get();
        pool.release(*a);
        pool.release(*a);
        assert(log.count(Bulwark::LogLevel::Warning) == 1);
        assert(pool.inactiveCount() == 1);
        checkAccounting(pool);
        Widget* b = pool.get();
        Widget* c = pool.get();
        assert(b != c);
    }
    {
        // Foreign instance: warned, hook runs, deactivated, but never adopted.
        TestSupport::LogCapture log;
        auto pool = makePool();
        int returns = 0;
        pool.setHooks(nullptr, [&returns](Widget&) { ++returns; });
        Widget stranger;
        stranger.active = true;
        pool.release(stranger);
        assert(log.count(Bulwark::LogLevel::Warning) == 1);
        assert(returns == 1);
        assert(!stranger.active);
        assert(pool.inactiveCount() == 0);
        assert(pool.createdCount() == 0);
    }
    {
        // Fixed-size pool reports exhaustion instead of growing.
        TestSupport::LogCapture log;
        auto pool = makePool(false);
        pool.prewarm(2);
        assert(pool.get());
        assert(pool.get());
        assert(pool.get() == nullptr);
        assert(log.count(Bulwark::LogLevel::Warning) == 1);
        assert(pool.createdCount() == 2);
    }
    {
        // releaseAll returns every active instance.
        auto pool = makePool();
        Widget* a = pool.get();
        Widget* b = pool.get();
        pool.get();
        pool.release(*b);
        pool.releaseAll();
        assert(pool.activeCount() == 0);
        assert(pool.inactiveCount() == 3);
        assert(!a->active);
        checkAccounting(pool);
    }
    {
        // clear destroys everything.
        auto pool = makePool();
        pool.prewarm(3);
        pool.get();
        pool.clear();
        assert(pool.activeCount() == 0);
        assert(pool.inactiveCount() == 0);
        assert(pool.createdCount() == 0);
    }
    {
        // Accounting holds through interleaved traffic.
        auto pool = makePool();
        std::vector<Widget*> live;
        for (int i = 0; i < 50; ++i) {
            if (i % 3 == 2 && !live.empty()) {
                pool.release(*live.back());
                live.pop_back();
            } else {
                live.push_back(pool.get());
            }
            checkAccounting(pool);
            assert(pool.activeCount() == live.size());
        }
    }
    return 0;
}
