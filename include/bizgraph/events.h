#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/events.h - Typed event emitter
// ═══════════════════════════════════════════════════════════════════
//
//  EventEmitter<InvalidationEvent> mutations;
//  auto id = mutations.on([](const InvalidationEvent& ev) { ... });
//  mutations.emit(ev);
//  mutations.off(id);
//
//  Listeners run synchronously on the emitting thread, outside the
//  emitter's lock, so a listener may register or remove listeners.
//
// ═══════════════════════════════════════════════════════════════════

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace bizgraph {

template <typename Event>
class EventEmitter {
public:
    using Listener = std::function<void(const Event&)>;
    using ListenerId = std::uint64_t;

    EventEmitter() : mutex_(std::make_unique<std::mutex>()) {}

    EventEmitter(EventEmitter&&) noexcept = default;
    EventEmitter& operator=(EventEmitter&&) noexcept = default;

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    // ── Register a persistent listener ──
    ListenerId on(Listener listener) {
        std::lock_guard<std::mutex> lock(*mutex_);
        auto id = nextId_++;
        entries_.push_back({id, std::make_shared<Listener>(std::move(listener)), false});
        return id;
    }

    // ── Register a one-time listener ──
    ListenerId once(Listener listener) {
        std::lock_guard<std::mutex> lock(*mutex_);
        auto id = nextId_++;
        entries_.push_back({id, std::make_shared<Listener>(std::move(listener)), true});
        return id;
    }

    // ── Remove a listener; false if it was not registered ──
    bool off(ListenerId id) {
        std::lock_guard<std::mutex> lock(*mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
            [id](const Entry& e) { return e.id == id; });
        if (it == entries_.end()) return false;
        entries_.erase(it);
        return true;
    }

    // ── Deliver an event; returns the number of listeners invoked ──
    std::size_t emit(const Event& event) {
        std::vector<std::shared_ptr<Listener>> toCall;
        {
            std::lock_guard<std::mutex> lock(*mutex_);
            toCall.reserve(entries_.size());
            for (auto& e : entries_) toCall.push_back(e.fn);
            entries_.erase(
                std::remove_if(entries_.begin(), entries_.end(),
                    [](const Entry& e) { return e.once; }),
                entries_.end());
        }
        for (auto& fn : toCall) {
            (*fn)(event);
        }
        return toCall.size();
    }

    void removeAllListeners() {
        std::lock_guard<std::mutex> lock(*mutex_);
        entries_.clear();
    }

    std::size_t listenerCount() const {
        std::lock_guard<std::mutex> lock(*mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        ListenerId id;
        std::shared_ptr<Listener> fn;
        bool once = false;
    };

    std::unique_ptr<std::mutex> mutex_;
    std::vector<Entry> entries_;
    ListenerId nextId_ = 1;
};

} // namespace bizgraph
