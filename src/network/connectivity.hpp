#pragma once

#include "core/observer.hpp"
#include <functional>

namespace daybook::network {

/**
 * Connectivity - current reachability plus change notifications.
 */
class Connectivity {
public:
    virtual ~Connectivity() = default;

    [[nodiscard]] virtual bool is_online() const = 0;

    /**
     * Called with the new value whenever reachability flips.
     */
    [[nodiscard]] virtual Subscription on_change(std::function<void(bool)> callback) = 0;
};

/**
 * ManualConnectivity - reachability set by the embedding code.
 */
class ManualConnectivity : public Connectivity {
public:
    explicit ManualConnectivity(bool online = true) : online_(online) {}

    [[nodiscard]] bool is_online() const override { return online_; }

    [[nodiscard]] Subscription on_change(std::function<void(bool)> callback) override {
        return observers_.subscribe(std::move(callback));
    }

    void set_online(bool online) {
        if (online_ == online) return;
        online_ = online;
        observers_.notify(online_);
    }

private:
    bool online_;
    ObserverList<bool> observers_;
};

} // namespace daybook::network
