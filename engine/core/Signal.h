// Observer list with connection handles and scoped subscriptions.
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace Bulwark {

namespace Detail {

struct SlotListBase {
    virtual ~SlotListBase() = default;
    virtual void disconnect(std::uint64_t id) = 0;
    virtual bool connected(std::uint64_t id) const = 0;
};

}  // namespace Detail

class Connection {
public:
    Connection() = default;
    Connection(std::weak_ptr<Detail::SlotListBase> owner, std::uint64_t id) : owner_(std::move(owner)), id_(id) {}

    void disconnect() {
        if (auto owner = owner_.lock()) {
            owner->disconnect(id_);
        }
        owner_.reset();
    }

    bool connected() const {
        auto owner = owner_.lock();
        return owner && owner->connected(id_);
    }

private:
    std::weak_ptr<Detail::SlotListBase> owner_;
    std::uint64_t id_{0};
};

// Disconnects on destruction.
class ScopedConnection {
public:
    ScopedConnection() = default;
    ScopedConnection(Connection c) : connection_(std::move(c)) {}
    ~ScopedConnection() { connection_.disconnect(); }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;
    ScopedConnection(ScopedConnection&& other) noexcept : connection_(std::move(other.connection_)) {
        other.connection_ = Connection{};
    }
    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            connection_.disconnect();
            connection_ = std::move(other.connection_);
            other.connection_ = Connection{};
        }
        return *this;
    }

    void disconnect() { connection_.disconnect(); }
    bool connected() const { return connection_.connected(); }

private:
    Connection connection_;
};

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;

    Signal() : slots_(std::make_shared<SlotList>()) {}

    // Copying a component must not share subscribers with the original.
    Signal(const Signal&) : slots_(std::make_shared<SlotList>()) {}
    Signal& operator=(const Signal&) {
        disconnectAll();
        return *this;
    }
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    Connection connect(Slot slot) {
        ensureSlots();
        const std::uint64_t id = ++slots_->nextId;
        slots_->entries.push_back({id, std::move(slot)});
        return Connection{slots_, id};
    }

    // Snapshot emission; slots disconnected mid-emit are skipped.
    void emit(Args... args) const {
        if (!slots_ || slots_->entries.empty()) return;
        auto keepAlive = slots_;
        std::vector<std::uint64_t> ids;
        ids.reserve(keepAlive->entries.size());
        for (const auto& entry : keepAlive->entries) ids.push_back(entry.id);
        for (std::uint64_t id : ids) {
            const Slot* slot = keepAlive->find(id);
            if (slot) {
                Slot copy = *slot;
                copy(args...);
            }
        }
    }

    void operator()(Args... args) const { emit(args...); }

    void disconnectAll() {
        if (slots_) slots_->entries.clear();
    }

    std::size_t slotCount() const { return slots_ ? slots_->entries.size() : 0; }
    bool empty() const { return slotCount() == 0; }

private:
    struct Entry {
        std::uint64_t id;
        Slot slot;
    };

    struct SlotList : Detail::SlotListBase {
        std::vector<Entry> entries;
        std::uint64_t nextId{0};

        void disconnect(std::uint64_t id) override {
            for (auto it = entries.begin(); it != entries.end(); ++it) {
                if (it->id == id) {
                    entries.erase(it);
                    return;
                }
            }
        }

        bool connected(std::uint64_t id) const override { return find(id) != nullptr; }

        const Slot* find(std::uint64_t id) const {
            for (const auto& entry : entries) {
                if (entry.id == id) return &entry.slot;
            }
            return nullptr;
        }
    };

    void ensureSlots() {
        if (!slots_) slots_ = std::make_shared<SlotList>();
    }

    std::shared_ptr<SlotList> slots_;
};

}  // namespace Bulwark
