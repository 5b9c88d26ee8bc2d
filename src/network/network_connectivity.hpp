#pragma once

#include "network/connectivity.hpp"
#include <QObject>

namespace daybook::network {

/**
 * NetworkConnectivity - reachability from QNetworkInformation.
 *
 * Falls back to "online" when no backend is available on the platform,
 * so sync attempts still run and report Offline from the gateway.
 */
class NetworkConnectivity : public QObject, public Connectivity {
    Q_OBJECT

public:
    explicit NetworkConnectivity(QObject* parent = nullptr);

    [[nodiscard]] bool is_online() const override { return online_; }
    [[nodiscard]] Subscription on_change(std::function<void(bool)> callback) override;

    [[nodiscard]] bool has_backend() const noexcept { return has_backend_; }

signals:
    void onlineChanged(bool online);

private:
    void update(bool online);

    bool has_backend_ = false;
    bool online_ = true;
    ObserverList<bool> observers_;
};

} // namespace daybook::network
