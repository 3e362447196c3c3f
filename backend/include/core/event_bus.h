#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace beacon {

/**
 * Handle for one channel subscription.
 *
 * Unsubscribes when destroyed or reset. Outliving the channel is fine: the
 * handle only holds a weak reference to it.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    [[nodiscard]] bool active() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

/**
 * Single-producer, multi-consumer broadcast channel.
 *
 * Subscribers receive events in publish order, including events published
 * from inside another subscriber's handler (those are queued until the
 * current dispatch finishes). There is no replay: a late subscriber sees only
 * future events. Publishing after close() is a no-op.
 *
 * Not thread-safe; all calls happen on the io_context thread.
 */
template <typename Event>
class Channel {
public:
    using Handler = std::function<void(const Event&)>;

    Channel() : state_(std::make_shared<State>()) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    [[nodiscard]] Subscription subscribe(Handler handler) {
        if (state_->closed || !handler) {
            return {};
        }
        auto slot = std::make_shared<Slot>();
        slot->id = state_->next_id++;
        slot->handler = std::move(handler);
        state_->slots.push_back(slot);

        std::weak_ptr<State> weak = state_;
        return Subscription([weak, id = slot->id]() {
            if (auto state = weak.lock()) {
                State::remove(*state, id);
            }
        });
    }

    void publish(Event event) {
        // Keep the state alive even if a handler destroys the channel.
        auto state = state_;
        if (state->closed) {
            return;
        }
        state->pending.push_back(std::move(event));
        if (state->dispatching) {
            return;
        }

        DispatchGuard guard(*state);
        while (!state->pending.empty() && !state->closed) {
            Event current = std::move(state->pending.front());
            state->pending.pop_front();

            auto slots = state->slots;
            for (const auto& slot : slots) {
                if (state->closed) {
                    break;
                }
                if (slot->active) {
                    slot->handler(current);
                }
            }
        }
    }

    /// Drops all subscribers and pending events; later publishes are ignored.
    void close() {
        state_->closed = true;
        for (auto& slot : state_->slots) {
            slot->active = false;
        }
        state_->slots.clear();
        state_->pending.clear();
    }

    [[nodiscard]] bool closed() const { return state_->closed; }
    [[nodiscard]] std::size_t subscriber_count() const { return state_->slots.size(); }

private:
    struct Slot {
        std::uint64_t id = 0;
        Handler handler;
        bool active = true;
    };

    struct State {
        std::vector<std::shared_ptr<Slot>> slots;
        std::deque<Event> pending;
        std::uint64_t next_id = 1;
        bool dispatching = false;
        bool closed = false;

        static void remove(State& state, std::uint64_t id) {
            for (auto it = state.slots.begin(); it != state.slots.end(); ++it) {
                if ((*it)->id == id) {
                    (*it)->active = false;
                    state.slots.erase(it);
                    return;
                }
            }
        }
    };

    struct DispatchGuard {
        explicit DispatchGuard(State& s) : state(s) { state.dispatching = true; }
        ~DispatchGuard() { state.dispatching = false; }
        State& state;
    };

    std::shared_ptr<State> state_;
};

} // namespace beacon
