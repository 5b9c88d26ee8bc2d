#pragma once

#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace daybook {

/**
 * Subscription - unsubscribe handle returned by ObserverList::subscribe().
 *
 * Unsubscribes on destruction. The handle may outlive the list; it then
 * does nothing.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { unsubscribe(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    void unsubscribe() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    [[nodiscard]] bool active() const noexcept { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

/**
 * ObserverList - callbacks registered by id.
 *
 * notify() iterates a snapshot, so callbacks may subscribe or unsubscribe
 * while being notified. A callback removed during notify() is not called
 * afterwards in the same round.
 */
template<typename... Args>
class ObserverList {
public:
    using Callback = std::function<void(Args...)>;

    ObserverList() : state_(std::make_shared<State>()) {}

    [[nodiscard]] Subscription subscribe(Callback cb) {
        const auto id = state_->next_id++;
        state_->callbacks.emplace(id, std::make_shared<Callback>(std::move(cb)));
        std::weak_ptr<State> weak = state_;
        return Subscription([weak, id] {
            if (auto s = weak.lock()) {
                s->callbacks.erase(id);
            }
        });
    }

    void notify(Args... args) const {
        std::vector<std::pair<uint64_t, std::weak_ptr<Callback>>> snapshot;
        snapshot.reserve(state_->callbacks.size());
        for (const auto& [id, cb] : state_->callbacks) {
            snapshot.emplace_back(id, cb);
        }
        for (const auto& [id, weak_cb] : snapshot) {
            if (!state_->callbacks.contains(id)) continue;
            if (auto cb = weak_cb.lock()) {
                (*cb)(args...);
            }
        }
    }

    [[nodiscard]] size_t size() const noexcept { return state_->callbacks.size(); }

private:
    struct State {
        uint64_t next_id = 1;
        std::map<uint64_t, std::shared_ptr<Callback>> callbacks;
    };
    std::shared_ptr<State> state_;
};

} // namespace daybook
